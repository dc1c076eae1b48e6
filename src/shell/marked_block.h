#pragma once

#include <string>

// Edits the one region of a shell startup file that ssoprof owns: the lines
// between a start and an end sentinel. Everything outside is left alone.
class MarkedBlockEditor {
public:
    static const char* DEFAULT_START;
    static const char* DEFAULT_END;

    MarkedBlockEditor(std::string startMarker = DEFAULT_START, std::string endMarker = DEFAULT_END);

    // Replace the lines between the markers with body, or append the marked
    // block (after one blank line) when there is none. Idempotent.
    // Throws MalformedDocument if only one of the markers is present.
    std::string upsert(const std::string& content, const std::string& body) const;

    // Drop the markers and everything between them. No-op without a block.
    std::string remove(const std::string& content) const;

    // Whether a complete start/end pair is present
    bool contains(const std::string& content) const;

    // Lines between the markers (empty if there is no block)
    std::string extract(const std::string& content) const;

    const std::string& startMarker() const { return m_start; }
    const std::string& endMarker() const { return m_end; }

private:
    struct Region {
        bool found = false;
        size_t startBegin = 0;  // offset of the start marker line
        size_t bodyBegin = 0;   // offset just past the start marker line
        size_t endBegin = 0;    // offset of the end marker line
        size_t endEnd = 0;      // offset just past the end marker line

        // Set when the markers don't pair up
        size_t badLine = 0;
        std::string badReason;
    };

    Region locate(const std::string& content) const;
    Region locateStrict(const std::string& content) const;

    std::string m_start;
    std::string m_end;
};
