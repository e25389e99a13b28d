#pragma once

#include "content_extractor.hpp"

namespace finbot_core {

/**
 * @class DelimitedTextExtractor
 * @brief Reads .csv (comma) and .tsv (tab) tables with a header row.
 *
 * Header names are matched case-insensitively after trimming. Rows become:
 *  - "Question: q\nAnswer: a" when the table has question and answer columns,
 *  - "Product: p\nDescription: d\nFeatures: f" for product tables,
 *  - "column: value" lines otherwise.
 * A category column, when present and non-empty, overrides the file stem.
 */
class DelimitedTextExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;

    // The extension picks the delimiter
    std::vector<ExtractedDocument> extract(const fs::path& file_path) const override;

    // Sniffs the delimiter: tab when the header line has one, comma otherwise
    std::vector<ExtractedDocument> extract_from_string(
        const std::string& content, const std::string& default_category) const override;

    std::vector<ExtractedDocument> extract_delimited(const std::string& content, char delimiter,
                                                     const std::string& default_category) const;

    // RFC 4180 style: quoted fields may hold delimiters, newlines and doubled quotes
    static std::vector<std::vector<std::string>> parse_rows(const std::string& content, char delimiter);
};

}  // namespace finbot_core
