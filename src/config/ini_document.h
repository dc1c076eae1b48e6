#pragma once

#include <string>
#include <utility>
#include <vector>

// One physical line of an INI-like file, kept verbatim so untouched content
// serializes back byte-for-byte.
enum class IniLineKind {
    Blank,
    Comment,    // '#' or ';'
    KeyValue,   // key = value
    Other       // continuation lines and anything else we don't interpret
};

struct IniLine {
    IniLineKind kind = IniLineKind::Blank;
    std::string raw;    // exact text without the terminating '\n'
    std::string key;    // KeyValue only, trimmed
    std::string value;  // KeyValue only, trimmed
};

using IniEntries = std::vector<std::pair<std::string, std::string>>;

struct IniSection {
    std::string header;          // bracket contents, trimmed: "profile 1234-Admin"
    std::string header_line;     // raw header line as read: "[profile 1234-Admin]"
    std::vector<IniLine> lines;  // everything after the header up to the next header

    // Key/value pairs in file order, duplicates included
    IniEntries entries() const;

    // Last value for key (empty if absent)
    std::string value(const std::string& key) const;
    bool hasKey(const std::string& key) const;

    // Index into lines[] where the run of blank/comment lines that ends the
    // section starts. Equals lines.size() when the section ends with a key.
    size_t trailingTriviaStart() const;
};

struct IniDocument {
    std::vector<IniLine> preamble;     // blank/comment lines before the first header
    std::vector<IniSection> sections;
    bool trailing_newline = false;     // whether the text ended with '\n'

    bool empty() const { return preamble.empty() && sections.empty(); }

    // First section with this header, or nullptr
    const IniSection* find(const std::string& header) const;
    std::vector<std::string> headers() const;
};

// Parse text into a document. Throws MalformedDocument when a key (or any
// other non-blank, non-comment line) appears before the first header.
// `path` is only used for error messages.
IniDocument parse_ini_document(const std::string& text, const std::string& path = "");

// Exact inverse of parse_ini_document for parsed content; reconciled
// sections are rendered in the canonical "key = value" form.
std::string serialize_ini_document(const IniDocument& doc);

// Build a section in canonical form
IniSection make_ini_section(const std::string& header, const IniEntries& entries);

// Single canonical "key = value" line
IniLine make_ini_key_line(const std::string& key, const std::string& value);
