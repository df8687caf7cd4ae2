#include "match/match_csv.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace redline {

namespace {

std::string quote_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_row(std::ostringstream& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << quote_field(fields[i]);
    }
    out << "\r\n";
}

} // namespace

std::string format_score(double score) {
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), score);
    if (ec != std::errc()) {
        std::ostringstream fallback;
        fallback << score;
        return fallback.str();
    }
    std::string s(buf, end);
    if (s.find_first_of(".eninf") == std::string::npos) s += ".0";
    return s;
}

std::string format_match_csv(const std::vector<MatchRecord>& records) {
    std::ostringstream out;
    write_row(out, match_csv_columns());
    for (const auto& r : records) {
        write_row(out, {
            std::to_string(r.start_ms),
            std::to_string(r.end_ms),
            r.matched_text,
            r.target_word,
            format_score(r.score),
            r.original_text,
            r.masked_text
        });
    }
    return out.str();
}

void write_match_csv(const std::string& path, const std::vector<MatchRecord>& records) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write match CSV: " + path);
    }
    file << format_match_csv(records);
    if (!file.good()) {
        throw std::runtime_error("Failed writing match CSV: " + path);
    }
}

std::vector<std::vector<std::string>> parse_csv(const std::string& content) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool quoted = false;
    bool rowHasData = false;

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        rows.push_back(std::move(row));
        row.clear();
        rowHasData = false;
    };

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                quoted = true;
                rowHasData = true;
                break;
            case ',':
                end_field();
                rowHasData = true;
                break;
            case '\r':
                break;
            case '\n':
                if (rowHasData || !field.empty()) end_row();
                break;
            default:
                field.push_back(c);
                rowHasData = true;
                break;
        }
    }
    if (rowHasData || !field.empty()) end_row();
    return rows;
}

} // namespace redline
