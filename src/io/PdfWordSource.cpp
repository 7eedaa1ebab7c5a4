#include "io/PdfWordSource.hpp"

#include "io/ProcUtil.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cvextract {

static void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// numeric character reference body ("#233", "#xE9"); 0 when malformed
static unsigned long parse_char_ref(const std::string& ent) {
    const bool hex = ent.size() > 2 && (ent[1] == 'x' || ent[1] == 'X');
    const std::string digits = ent.substr(hex ? 2 : 1);
    if (digits.empty()) return 0;

    char* end = nullptr;
    const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
    if (end == nullptr || *end != '\0' || cp > 0x10FFFF) return 0;
    return cp;
}

std::string decode_xml_entities(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '&') {
            const size_t j = in.find(';', i + 1);
            if (j != std::string::npos && j - i <= 10) {
                const std::string ent = in.substr(i + 1, j - (i + 1));
                std::string rep;
                if (ent == "amp") rep = "&";
                else if (ent == "lt") rep = "<";
                else if (ent == "gt") rep = ">";
                else if (ent == "quot") rep = "\"";
                else if (ent == "apos") rep = "'";
                else if (!ent.empty() && ent[0] == '#') {
                    if (const unsigned long cp = parse_char_ref(ent)) append_utf8(rep, cp);
                }
                if (!rep.empty()) {
                    out += rep;
                    i = j;
                    continue;
                }
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

// value of name="..." inside one tag, 0 when absent
static double attr_number(const std::string& tag, const std::string& name) {
    const std::string key = " " + name + "=\"";
    const size_t at = tag.find(key);
    if (at == std::string::npos) return 0.0;
    return std::strtod(tag.c_str() + at + key.size(), nullptr);
}

std::vector<Page> parse_bbox_document(const std::string& xhtml) {
    std::vector<Page> pages;

    size_t pos = 0;
    while (true) {
        const size_t lt = xhtml.find('<', pos);
        if (lt == std::string::npos) break;
        const size_t gt = xhtml.find('>', lt);
        if (gt == std::string::npos) break;
        const std::string tag = xhtml.substr(lt, gt - lt + 1);
        pos = gt + 1;

        if (tag.compare(0, 6, "<page ") == 0) {
            Page p;
            p.width = attr_number(tag, "width");
            pages.push_back(std::move(p));
            continue;
        }
        if (tag.compare(0, 6, "<word ") != 0 || pages.empty()) continue;

        const size_t close = xhtml.find("</word>", pos);
        if (close == std::string::npos) break;

        WordToken w;
        w.text = decode_xml_entities(xhtml.substr(pos, close - pos));
        w.box.left = attr_number(tag, "xMin");
        w.box.top = attr_number(tag, "yMin");
        w.box.right = attr_number(tag, "xMax");
        w.box.bottom = attr_number(tag, "yMax");
        w.page = static_cast<int>(pages.size()) - 1;
        pages.back().words.push_back(std::move(w));

        pos = close + 7;
    }
    return pages;
}

std::vector<Page> decode_pdf_words(const std::string& pdf_path) {
    if (!procutil::command_exists("pdftotext")) {
        throw std::runtime_error("pdftotext not found; install poppler-utils");
    }
    const std::string cmd = "pdftotext -bbox -q " + procutil::shell_quote(pdf_path) + " -";
    return parse_bbox_document(procutil::run_capture_stdout(cmd));
}

}  // namespace cvextract
