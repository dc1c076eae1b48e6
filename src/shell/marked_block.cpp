#include "shell/marked_block.h"
#include "errors.h"
#include "util/strings.h"

#include <vector>

const char* MarkedBlockEditor::DEFAULT_START = "# ssoprof profile switcher - START";
const char* MarkedBlockEditor::DEFAULT_END = "# ssoprof profile switcher - END";

MarkedBlockEditor::MarkedBlockEditor(std::string startMarker, std::string endMarker)
    : m_start(std::move(startMarker)), m_end(std::move(endMarker)) {}

MarkedBlockEditor::Region MarkedBlockEditor::locate(const std::string& content) const {
    Region region;
    bool inBlock = false;
    size_t startLine = 0;
    size_t lineNumber = 0;
    size_t pos = 0;

    while (pos < content.size()) {
        ++lineNumber;
        size_t nl = content.find('\n', pos);
        size_t lineEnd = nl == std::string::npos ? content.size() : nl;
        size_t next = nl == std::string::npos ? content.size() : nl + 1;
        std::string line = trim(content.substr(pos, lineEnd - pos));

        if (!inBlock && line == m_start) {
            inBlock = true;
            startLine = lineNumber;
            region.startBegin = pos;
            region.bodyBegin = next;
        } else if (!inBlock && line == m_end) {
            region.badLine = lineNumber;
            region.badReason = "end marker without a start marker";
            return region;
        } else if (inBlock && line == m_end) {
            region.endBegin = pos;
            region.endEnd = next;
            region.found = true;
            return region;
        }
        pos = next;
    }

    if (inBlock) {
        region.badLine = startLine;
        region.badReason = "start marker without an end marker";
    }
    return region;
}

MarkedBlockEditor::Region MarkedBlockEditor::locateStrict(const std::string& content) const {
    Region region = locate(content);
    if (region.badLine > 0) {
        std::vector<std::string> lines = split_lines(content);
        throw MalformedDocument("", region.badLine, lines[region.badLine - 1], region.badReason);
    }
    return region;
}

static std::string with_final_newline(const std::string& text) {
    if (text.empty() || text.back() == '\n') {
        return text;
    }
    return text + "\n";
}

std::string MarkedBlockEditor::upsert(const std::string& content, const std::string& body) const {
    Region region = locateStrict(content);
    std::string inner = with_final_newline(body);

    if (region.found) {
        return content.substr(0, region.bodyBegin) + inner + content.substr(region.endBegin);
    }

    std::string out = content;
    if (!out.empty()) {
        if (out.back() != '\n') {
            out += '\n';
        }
        bool endsWithBlankLine = out == "\n" || ends_with(out, "\n\n");
        if (!endsWithBlankLine) {
            out += '\n';
        }
    }
    out += m_start + "\n" + inner + m_end + "\n";
    return out;
}

std::string MarkedBlockEditor::remove(const std::string& content) const {
    Region region = locateStrict(content);
    if (!region.found) {
        return content;
    }
    return content.substr(0, region.startBegin) + content.substr(region.endEnd);
}

bool MarkedBlockEditor::contains(const std::string& content) const {
    return locate(content).found;
}

std::string MarkedBlockEditor::extract(const std::string& content) const {
    Region region = locate(content);
    if (!region.found) {
        return "";
    }
    return content.substr(region.bodyBegin, region.endBegin - region.bodyBegin);
}
