#pragma once
#include <string>
#include <vector>

#include "cvextract/Models.hpp"

namespace cvextract {

// "&amp;" -> "&", numeric references included (encoded back to UTF-8)
std::string decode_xml_entities(const std::string& in);

// Parses the XHTML written by `pdftotext -bbox`: one Page per <page width=..>,
// one WordToken per <word xMin yMin xMax yMax>. Pages without words are kept.
std::vector<Page> parse_bbox_document(const std::string& xhtml);

// Runs pdftotext -bbox on a PDF. Throws std::runtime_error when the tool is
// missing or fails.
std::vector<Page> decode_pdf_words(const std::string& pdf_path);

}  // namespace cvextract
