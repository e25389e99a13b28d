#include "finbot_core/extractors/json_extractor.hpp"

#include <nlohmann/json.hpp>

namespace finbot_core {
namespace {

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_string()) {
        return "";
    }
    return object[key].get<std::string>();
}

void add_question_answer(const nlohmann::json& item, const std::string& category,
                         std::vector<ExtractedDocument>& out) {
    std::string question = string_field(item, "question");
    std::string answer = string_field(item, "answer");
    if (question.empty() || answer.empty()) {
        return;
    }
    out.push_back({ContentExtractor::format_question_answer(question, answer), category});
}

}  // namespace

bool JsonExtractor::can_handle(const fs::path& file_path) const {
    return lower_extension(file_path) == ".json";
}

std::vector<ExtractedDocument> JsonExtractor::extract_from_string(
    const std::string& content, const std::string& default_category) const {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ContentExtractorError("Invalid JSON: " + std::string(e.what()));
    }

    std::vector<ExtractedDocument> documents;
    if (data.is_object() && data.contains("categories")) {
        if (!data["categories"].is_array()) {
            throw ContentExtractorError("'categories' must be an array");
        }
        for (const auto& category : data["categories"]) {
            std::string category_name = string_field(category, "category");
            if (category_name.empty()) {
                category_name = "Uncategorized";
            }
            if (!category.contains("questions") || !category["questions"].is_array()) {
                continue;
            }
            for (const auto& item : category["questions"]) {
                add_question_answer(item, category_name, documents);
            }
        }
    } else if (data.is_array()) {
        for (const auto& item : data) {
            std::string category_name = string_field(item, "category");
            add_question_answer(item, category_name.empty() ? default_category : category_name,
                                documents);
        }
    } else {
        throw ContentExtractorError(
            "Unrecognised JSON layout: expected a 'categories' object or an array of entries");
    }
    return documents;
}

}  // namespace finbot_core
