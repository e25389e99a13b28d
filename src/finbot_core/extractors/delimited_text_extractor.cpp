#include "finbot_core/extractors/delimited_text_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace finbot_core {
namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<size_t> find_column(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::string cell(const std::vector<std::string>& row, std::optional<size_t> column) {
    if (!column || *column >= row.size()) {
        return "";
    }
    return trim(row[*column]);
}

}  // namespace

bool DelimitedTextExtractor::can_handle(const fs::path& file_path) const {
    const std::string extension = lower_extension(file_path);
    return extension == ".csv" || extension == ".tsv";
}

std::vector<ExtractedDocument> DelimitedTextExtractor::extract(const fs::path& file_path) const {
    if (!can_handle(file_path)) {
        throw ContentExtractorError("Unsupported file type: " + file_path.string());
    }
    char delimiter = lower_extension(file_path) == ".tsv" ? '\t' : ',';
    return extract_delimited(get_string_content(file_path), delimiter, file_path.stem().string());
}

std::vector<ExtractedDocument> DelimitedTextExtractor::extract_from_string(
    const std::string& content, const std::string& default_category) const {
    std::string first_line = content.substr(0, content.find('\n'));
    char delimiter = first_line.find('\t') != std::string::npos ? '\t' : ',';
    return extract_delimited(content, delimiter, default_category);
}

std::vector<std::vector<std::string>> DelimitedTextExtractor::parse_rows(const std::string& content,
                                                                         char delimiter) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_data = false;

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        if (row_has_data) {
            rows.push_back(std::move(row));
        }
        row.clear();
        row_has_data = false;
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            row_has_data = true;
        } else if (c == delimiter) {
            end_field();
            row_has_data = true;
        } else if (c == '\n') {
            end_row();
        } else if (c == '\r') {
            // CRLF line endings
        } else {
            field.push_back(c);
            row_has_data = true;
        }
    }
    if (in_quotes) {
        throw ContentExtractorError("Unterminated quoted field");
    }
    if (row_has_data || !field.empty()) {
        end_row();
    }
    return rows;
}

std::vector<ExtractedDocument> DelimitedTextExtractor::extract_delimited(
    const std::string& content, char delimiter, const std::string& default_category) const {
    auto rows = parse_rows(content, delimiter);
    if (rows.empty()) {
        return {};
    }

    std::vector<std::string> header;
    for (const auto& name : rows.front()) {
        header.push_back(to_lower(trim(name)));
    }
    // Excel exports often start with a UTF-8 byte order mark
    if (!header.empty() && header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
        header[0] = header[0].substr(3);
    }

    auto question_col = find_column(header, "question");
    auto answer_col = find_column(header, "answer");
    auto category_col = find_column(header, "category");
    auto product_col = find_column(header, "product");
    auto description_col = find_column(header, "description");
    auto features_col = find_column(header, "features");

    std::vector<ExtractedDocument> documents;
    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        std::string category = cell(row, category_col);
        if (category.empty()) {
            category = default_category;
        }

        if (question_col && answer_col) {
            std::string question = cell(row, question_col);
            std::string answer = cell(row, answer_col);
            if (!question.empty() && !answer.empty()) {
                documents.push_back({format_question_answer(question, answer), category});
            }
        } else if (product_col && description_col) {
            std::string product = cell(row, product_col);
            std::string description = cell(row, description_col);
            std::string features = cell(row, features_col);
            if (product.empty() || (description.empty() && features.empty())) {
                continue;
            }
            std::string text = "Product: " + product;
            if (!description.empty()) {
                text += "\nDescription: " + description;
            }
            if (!features.empty()) {
                text += "\nFeatures: " + features;
            }
            documents.push_back({text, category});
        } else {
            std::string text;
            for (size_t c = 0; c < header.size() && c < row.size(); ++c) {
                std::string value = trim(row[c]);
                if (value.empty() || header[c].empty()) {
                    continue;
                }
                if (!text.empty()) {
                    text += "\n";
                }
                text += header[c] + ": " + value;
            }
            if (!text.empty()) {
                documents.push_back({text, category});
            }
        }
    }
    return documents;
}

}  // namespace finbot_core
