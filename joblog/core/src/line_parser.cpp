#include <joblog/core/line_parser.hpp>

#include <algorithm>
#include <cctype>

namespace joblog::core {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string to_upper(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

constexpr std::size_t kFieldCount = 4;

} // anonymous namespace

std::string_view trim(std::string_view text) noexcept {
    std::size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

std::vector<std::string_view> split_fields(std::string_view line, std::size_t max_fields) {
    std::vector<std::string_view> fields;
    if (max_fields == 0) {
        max_fields = 1;
    }
    fields.reserve(max_fields);

    std::size_t pos = 0;
    while (fields.size() + 1 < max_fields) {
        const auto comma = line.find(',', pos);
        if (comma == std::string_view::npos) {
            break;
        }
        fields.push_back(trim(line.substr(pos, comma - pos)));
        pos = comma + 1;
    }
    // Remainder, commas included
    fields.push_back(trim(line.substr(pos)));
    return fields;
}

ParsedLine parse_line(std::string_view raw_line) {
    const std::string_view line = trim(raw_line);
    if (line.empty()) {
        return BlankLine{};
    }

    const auto fields = split_fields(line, kFieldCount);
    if (fields.size() != kFieldCount) {
        return MalformedLine{fields.size()};
    }

    const auto time_of_day = parse_time_of_day(fields[0]);
    if (!time_of_day) {
        return BadTimestamp{std::string(fields[0])};
    }

    std::string event = to_upper(fields[2]);
    EventKind kind{};
    if (event == "START") {
        kind = EventKind::start;
    } else if (event == "END") {
        kind = EventKind::end;
    } else {
        return UnknownEvent{std::move(event)};
    }

    return LogRecord{*time_of_day, std::string(fields[1]), kind, std::string(fields[3])};
}

} // namespace joblog::core
