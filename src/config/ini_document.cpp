#include "config/ini_document.h"
#include "errors.h"
#include "util/strings.h"

IniEntries IniSection::entries() const {
    IniEntries out;
    for (const auto& line : lines) {
        if (line.kind == IniLineKind::KeyValue) {
            out.emplace_back(line.key, line.value);
        }
    }
    return out;
}

std::string IniSection::value(const std::string& key) const {
    std::string result;
    for (const auto& line : lines) {
        if (line.kind == IniLineKind::KeyValue && line.key == key) {
            result = line.value;
        }
    }
    return result;
}

bool IniSection::hasKey(const std::string& key) const {
    for (const auto& line : lines) {
        if (line.kind == IniLineKind::KeyValue && line.key == key) {
            return true;
        }
    }
    return false;
}

size_t IniSection::trailingTriviaStart() const {
    size_t i = lines.size();
    while (i > 0) {
        IniLineKind kind = lines[i - 1].kind;
        if (kind != IniLineKind::Blank && kind != IniLineKind::Comment) {
            break;
        }
        --i;
    }
    return i;
}

const IniSection* IniDocument::find(const std::string& header) const {
    for (const auto& section : sections) {
        if (section.header == header) {
            return &section;
        }
    }
    return nullptr;
}

std::vector<std::string> IniDocument::headers() const {
    std::vector<std::string> out;
    out.reserve(sections.size());
    for (const auto& section : sections) {
        out.push_back(section.header);
    }
    return out;
}

static IniLine classify_line(const std::string& raw) {
    IniLine line;
    line.raw = raw;

    std::string trimmed = trim(raw);
    if (trimmed.empty()) {
        line.kind = IniLineKind::Blank;
        return line;
    }
    if (trimmed[0] == '#' || trimmed[0] == ';') {
        line.kind = IniLineKind::Comment;
        return line;
    }
    // Indented lines continue the previous key (e.g. nested s3 settings)
    if (raw[0] == ' ' || raw[0] == '\t') {
        line.kind = IniLineKind::Other;
        return line;
    }

    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
        line.kind = IniLineKind::Other;
        return line;
    }
    line.kind = IniLineKind::KeyValue;
    line.key = trim(trimmed.substr(0, eq));
    line.value = trim(trimmed.substr(eq + 1));
    return line;
}

static bool parse_header(const std::string& raw, std::string& header) {
    std::string trimmed = trim(raw);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        return false;
    }
    header = trim(trimmed.substr(1, trimmed.size() - 2));
    return true;
}

IniDocument parse_ini_document(const std::string& text, const std::string& path) {
    IniDocument doc;
    if (text.empty()) {
        return doc;
    }

    std::vector<std::string> rawLines = split_lines(text, &doc.trailing_newline);

    IniSection* current = nullptr;
    size_t lineNumber = 0;
    for (const auto& raw : rawLines) {
        ++lineNumber;

        std::string header;
        if (parse_header(raw, header)) {
            IniSection section;
            section.header = header;
            section.header_line = raw;
            doc.sections.push_back(std::move(section));
            current = &doc.sections.back();
            continue;
        }

        IniLine line = classify_line(raw);
        if (current) {
            current->lines.push_back(std::move(line));
            continue;
        }
        if (line.kind != IniLineKind::Blank && line.kind != IniLineKind::Comment) {
            throw MalformedDocument(path, lineNumber, raw, "entry outside of any section");
        }
        doc.preamble.push_back(std::move(line));
    }

    return doc;
}

std::string serialize_ini_document(const IniDocument& doc) {
    std::string out;
    bool first = true;
    auto emit = [&](const std::string& raw) {
        if (!first) {
            out += '\n';
        }
        out += raw;
        first = false;
    };

    for (const auto& line : doc.preamble) {
        emit(line.raw);
    }
    for (const auto& section : doc.sections) {
        emit(section.header_line);
        for (const auto& line : section.lines) {
            emit(line.raw);
        }
    }

    if (!first && doc.trailing_newline) {
        out += '\n';
    }
    return out;
}

IniLine make_ini_key_line(const std::string& key, const std::string& value) {
    IniLine line;
    line.kind = IniLineKind::KeyValue;
    line.key = key;
    line.value = value;
    line.raw = key + " = " + value;
    return line;
}

IniSection make_ini_section(const std::string& header, const IniEntries& entries) {
    IniSection section;
    section.header = header;
    section.header_line = "[" + header + "]";
    for (const auto& [key, value] : entries) {
        section.lines.push_back(make_ini_key_line(key, value));
    }
    return section;
}
