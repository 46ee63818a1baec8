// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/nzb/nzb_document.hpp>
#include <expat.h>
#include <charconv>
#include <cstring>
#include <memory>

namespace spool::nzb {

namespace {

enum class Element : std::uint8_t {
    other,
    meta,
    file,
    group,
    segment,
};

struct ParseState {
    XML_Parser parser{nullptr};
    NzbDocument doc;
    Element current{Element::other};
    NzbFile* file{nullptr};
    std::string text;
    std::string meta_type;
    NzbSegment segment;
    bool failed{false};
};

const char* find_attr(const XML_Char** attrs, const char* name) noexcept {
    for (int i = 0; attrs[i] != nullptr; i += 2) {
        if (std::strcmp(attrs[i], name) == 0) {
            return attrs[i + 1];
        }
    }
    return nullptr;
}

template<typename T>
T parse_number(const char* value) noexcept {
    T out{0};
    if (value == nullptr) return out;
    std::string_view sv(value);
    while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
    while (!sv.empty() && sv.back() == ' ') sv.remove_suffix(1);
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return T{0};
    }
    return out;
}

std::string trimmed(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char** attrs) {
    auto* state = static_cast<ParseState*>(user);
    try {
        state->text.clear();

        if (std::strcmp(name, "file") == 0) {
            NzbFile file;
            if (const char* subject = find_attr(attrs, "subject")) file.subject = subject;
            if (const char* poster = find_attr(attrs, "poster")) file.poster = poster;
            file.date = parse_number<std::int64_t>(find_attr(attrs, "date"));
            state->doc.files.push_back(std::move(file));
            state->file = &state->doc.files.back();
            state->current = Element::file;
        } else if (std::strcmp(name, "segment") == 0 && state->file) {
            state->segment = NzbSegment{};
            state->segment.bytes = parse_number<std::int64_t>(find_attr(attrs, "bytes"));
            state->segment.number = parse_number<std::int32_t>(find_attr(attrs, "number"));
            state->current = Element::segment;
        } else if (std::strcmp(name, "group") == 0 && state->file) {
            state->current = Element::group;
        } else if (std::strcmp(name, "meta") == 0) {
            const char* type = find_attr(attrs, "type");
            state->meta_type = type ? type : "";
            state->current = Element::meta;
        } else {
            state->current = Element::other;
        }
    } catch (const std::exception&) {
        state->failed = true;
        XML_StopParser(state->parser, XML_FALSE);
    }
}

void XMLCALL on_end(void* user, const XML_Char* name) {
    auto* state = static_cast<ParseState*>(user);
    try {
        if (std::strcmp(name, "file") == 0) {
            state->file = nullptr;
        } else if (std::strcmp(name, "segment") == 0 && state->current == Element::segment && state->file) {
            state->segment.id = trimmed(state->text);
            state->file->segments.push_back(std::move(state->segment));
        } else if (std::strcmp(name, "group") == 0 && state->current == Element::group && state->file) {
            auto group = trimmed(state->text);
            if (!group.empty()) {
                state->file->groups.push_back(std::move(group));
            }
        } else if (std::strcmp(name, "meta") == 0 && state->current == Element::meta) {
            if (!state->meta_type.empty()) {
                state->doc.head[state->meta_type] = trimmed(state->text);
            }
        }
        state->current = Element::other;
        state->text.clear();
    } catch (const std::exception&) {
        state->failed = true;
        XML_StopParser(state->parser, XML_FALSE);
    }
}

void XMLCALL on_text(void* user, const XML_Char* s, int len) {
    auto* state = static_cast<ParseState*>(user);
    if (state->current == Element::other || state->current == Element::file) {
        return;
    }
    try {
        state->text.append(s, static_cast<std::size_t>(len));
    } catch (const std::exception&) {
        state->failed = true;
        XML_StopParser(state->parser, XML_FALSE);
    }
}

} // namespace

std::expected<NzbDocument, std::error_code> parse_nzb(std::string_view xml) noexcept {
    std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser(XML_ParserCreate(nullptr), &XML_ParserFree);
    if (!parser) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }

    ParseState state;
    state.parser = parser.get();
    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), on_start, on_end);
    XML_SetCharacterDataHandler(parser.get(), on_text);

    auto status = XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), XML_TRUE);
    if (status != XML_STATUS_OK || state.failed) {
        return std::unexpected(make_error_code(core::StreamErrc::malformed_archive));
    }

    return std::move(state.doc);
}

} // namespace spool::nzb
