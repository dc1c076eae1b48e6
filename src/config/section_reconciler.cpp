#include "config/section_reconciler.h"
#include "util/strings.h"

#include <algorithm>
#include <cctype>
#include <map>

static const char* PROFILE_PREFIX = "profile ";
static const size_t ACCOUNT_ID_LENGTH = 12;

bool is_generated_profile_header(const std::string& header) {
    if (!starts_with(header, PROFILE_PREFIX)) {
        return false;
    }
    std::string name = header.substr(std::string(PROFILE_PREFIX).size());
    if (name.size() < ACCOUNT_ID_LENGTH + 2 || name[ACCOUNT_ID_LENGTH] != '-') {
        return false;
    }
    return std::all_of(name.begin(), name.begin() + ACCOUNT_ID_LENGTH,
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

static bool same_section(const IniSection& a, const IniSection& b) {
    if (a.header_line != b.header_line || a.lines.size() != b.lines.size()) {
        return false;
    }
    for (size_t i = 0; i < a.lines.size(); ++i) {
        if (a.lines[i].raw != b.lines[i].raw) {
            return false;
        }
    }
    return true;
}

// Last write wins for both headers and keys, at the position first seen
static std::vector<DesiredSection> normalize_desired(const std::vector<DesiredSection>& desired) {
    std::vector<DesiredSection> out;
    std::map<std::string, size_t> byHeader;

    for (const auto& section : desired) {
        auto it = byHeader.find(section.header);
        if (it == byHeader.end()) {
            byHeader[section.header] = out.size();
            out.push_back({section.header, {}});
        } else {
            out[it->second].entries.clear();
        }
        IniEntries& entries = out[byHeader[section.header]].entries;

        std::map<std::string, size_t> byKey;
        for (const auto& [key, value] : section.entries) {
            auto k = byKey.find(key);
            if (k == byKey.end()) {
                byKey[key] = entries.size();
                entries.emplace_back(key, value);
            } else {
                entries[k->second].second = value;
            }
        }
    }
    return out;
}

static bool is_stale_profile(const IniSection& section, const PruneScope* scope) {
    if (!scope || !is_generated_profile_header(section.header)) {
        return false;
    }
    return section.value("sso_session") == scope->sso_session;
}

static bool ends_with_cr(const std::string& raw) {
    return !raw.empty() && raw.back() == '\r';
}

// A document uses CRLF if its first line does
static bool uses_crlf(const IniDocument& doc) {
    if (!doc.preamble.empty()) {
        return ends_with_cr(doc.preamble.front().raw);
    }
    return !doc.sections.empty() && ends_with_cr(doc.sections.front().header_line);
}

static IniLine blank_line(bool crlf) {
    IniLine line;
    line.raw = crlf ? "\r" : "";
    return line;
}

// Canonical section with the line ending the surrounding file uses
static IniSection build_section(const DesiredSection& want, bool crlf) {
    IniSection section = make_ini_section(want.header, want.entries);
    if (crlf) {
        section.header_line += '\r';
        for (auto& line : section.lines) {
            line.raw += '\r';
        }
    }
    return section;
}

static void drop_trailing_blank_lines(std::vector<IniLine>& lines) {
    while (!lines.empty() && lines.back().kind == IniLineKind::Blank) {
        lines.pop_back();
    }
}

// The container holding the last line of the document
static std::vector<IniLine>* last_line_container(IniDocument& doc) {
    if (!doc.sections.empty()) {
        return &doc.sections.back().lines;
    }
    return &doc.preamble;
}

// Keep the document ending cleanly once its old final section is gone
static void tidy_tail_after_removal(IniDocument& doc, bool lastSectionRemoved) {
    if (!lastSectionRemoved) {
        return;
    }
    drop_trailing_blank_lines(*last_line_container(doc));
    if (doc.empty()) {
        doc.trailing_newline = false;
    }
}

IniDocument reconcile_sections(const IniDocument& current,
                               const std::vector<DesiredSection>& desired,
                               const PruneScope* scope,
                               ReconcileReport* report) {
    ReconcileReport localReport;
    ReconcileReport& rep = report ? *report : localReport;

    std::vector<DesiredSection> wanted = normalize_desired(desired);
    std::map<std::string, size_t> wantedIndex;
    for (size_t i = 0; i < wanted.size(); ++i) {
        wantedIndex[wanted[i].header] = i;
    }
    std::vector<bool> placed(wanted.size(), false);

    IniDocument out;
    out.preamble = current.preamble;
    out.trailing_newline = current.trailing_newline;

    bool lastSectionRemoved = false;
    for (size_t s = 0; s < current.sections.size(); ++s) {
        const IniSection& existing = current.sections[s];
        bool isLast = s + 1 == current.sections.size();

        auto it = wantedIndex.find(existing.header);
        if (it != wantedIndex.end()) {
            if (placed[it->second]) {
                // Second copy of a header we already own
                rep.removed.push_back(existing.header);
                lastSectionRemoved = isLast;
                continue;
            }
            const DesiredSection& want = wanted[it->second];
            IniSection replacement = build_section(want, ends_with_cr(existing.header_line));
            // Spacing up to the next section stays as the user had it
            replacement.lines.insert(replacement.lines.end(),
                                     existing.lines.begin() + existing.trailingTriviaStart(),
                                     existing.lines.end());
            if (!same_section(existing, replacement)) {
                rep.replaced.push_back(existing.header);
            }
            out.sections.push_back(std::move(replacement));
            placed[it->second] = true;
            lastSectionRemoved = false;
            continue;
        }

        if (is_stale_profile(existing, scope)) {
            rep.removed.push_back(existing.header);
            lastSectionRemoved = isLast;
            continue;
        }

        out.sections.push_back(existing);
        lastSectionRemoved = false;
    }

    tidy_tail_after_removal(out, lastSectionRemoved);

    bool crlf = uses_crlf(current);
    for (size_t i = 0; i < wanted.size(); ++i) {
        if (placed[i]) {
            continue;
        }
        if (!out.empty()) {
            std::vector<IniLine>* tail = last_line_container(out);
            if (crlf && !out.trailing_newline) {
                // The old last line had no terminator at all; give it a CR to match
                std::string& last = tail->empty() ? out.sections.back().header_line : tail->back().raw;
                if (!ends_with_cr(last)) {
                    last += '\r';
                }
            }
            bool needsSeparator = tail->empty() ? !out.sections.empty() : tail->back().kind != IniLineKind::Blank;
            if (needsSeparator) {
                tail->push_back(blank_line(crlf));
            }
        }
        out.sections.push_back(build_section(wanted[i], crlf));
        out.trailing_newline = true;
        rep.added.push_back(wanted[i].header);
    }

    return out;
}

IniDocument remove_sections(const IniDocument& current,
                            const std::vector<std::string>& headers,
                            ReconcileReport* report) {
    IniDocument out;
    out.preamble = current.preamble;
    out.trailing_newline = current.trailing_newline;

    bool lastSectionRemoved = false;
    for (size_t s = 0; s < current.sections.size(); ++s) {
        const IniSection& existing = current.sections[s];
        if (std::find(headers.begin(), headers.end(), existing.header) != headers.end()) {
            if (report) {
                report->removed.push_back(existing.header);
            }
            lastSectionRemoved = s + 1 == current.sections.size();
            continue;
        }
        out.sections.push_back(existing);
        lastSectionRemoved = false;
    }

    tidy_tail_after_removal(out, lastSectionRemoved);
    return out;
}
