#include "passage_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>

namespace passage_core {

namespace {

// Collects the operands of the text-showing operators of a content stream
class TextShowCallback : public QPDFObjectHandle::ParserCallbacks {
 public:
  explicit TextShowCallback(std::stringstream& text) : text_(text) {}

  void handleObject(QPDFObjectHandle obj) override {
    if (obj.isOperator()) {
      const std::string op = obj.getOperatorValue();
      // Operands precede their operator, so strings are held until we know
      // they belong to a text-showing operator.
      if (op == "Tj" || op == "TJ" || op == "'" || op == "\"") {
        flush_pending(" ");
      } else if (op == "ET" || op == "T*" || op == "Td" || op == "TD") {
        text_ << "\n";
        pending_.clear();
      } else {
        pending_.clear();
      }
      return;
    }
    if (obj.isString()) {
      pending_ += obj.getUTF8Value();
    } else if (obj.isArray()) {
      for (auto& item : obj.getArrayAsVector()) {
        if (item.isString()) {
          pending_ += item.getUTF8Value();
        }
      }
    }
  }

  void handleEOF() override {}

 private:
  void flush_pending(const char* separator) {
    if (!pending_.empty()) {
      text_ << pending_ << separator;
      pending_.clear();
    }
  }

  std::stringstream& text_;
  std::string pending_;
};

}  // namespace

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
  return extension == ".pdf";
}

std::vector<PageText> PdfExtractor::extract_pages(const fs::path& file_path) const {
  try {
    return extract_with_poppler(file_path);
  } catch (const std::exception& e) {
    std::cerr << "[PdfExtractor] poppler failed for " << file_path.string() << ": " << e.what()
              << ". Trying qpdf." << std::endl;
  }

  try {
    return extract_with_qpdf(file_path);
  } catch (const std::exception& e) {
    std::cerr << "[PdfExtractor] Error extracting PDF " << file_path.string() << ": " << e.what()
              << std::endl;
  }
  return {};
}

std::vector<PageText> PdfExtractor::extract_with_poppler(const fs::path& file_path) const {
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Poppler failed to open PDF: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is password protected: " + file_path.string());
  }

  std::vector<PageText> pages;
  for (int i = 0; i < doc->pages(); ++i) {
    try {
      std::unique_ptr<poppler::page> page(doc->create_page(i));
      if (!page) {
        std::cerr << "[PdfExtractor] Skipping unreadable page " << (i + 1) << " of "
                  << file_path.string() << std::endl;
        continue;
      }
      poppler::byte_array utf8 = page->text().to_utf8();
      append_page(pages, i + 1, std::string(utf8.begin(), utf8.end()));
    } catch (const std::exception& e) {
      std::cerr << "[PdfExtractor] Failed to extract page " << (i + 1) << " of "
                << file_path.string() << ": " << e.what() << std::endl;
    }
  }
  return pages;
}

std::vector<PageText> PdfExtractor::extract_with_qpdf(const fs::path& file_path) const {
  QPDF pdf;
  try {
    pdf.processFile(file_path.string().c_str());
  } catch (const std::exception& e) {
    throw ContentExtractorError("QPDF failed to open PDF: " + std::string(e.what()));
  }

  QPDFPageDocumentHelper dh(pdf);
  auto qpdf_pages = dh.getAllPages();

  std::vector<PageText> pages;
  for (size_t i = 0; i < qpdf_pages.size(); ++i) {
    try {
      std::stringstream text;
      TextShowCallback callback(text);
      qpdf_pages[i].parseContents(&callback);
      append_page(pages, static_cast<int>(i) + 1, text.str());
    } catch (const std::exception& e) {
      std::cerr << "[PdfExtractor] Failed to extract page " << (i + 1) << " of "
                << file_path.string() << ": " << e.what() << std::endl;
    }
  }
  return pages;
}

}  // namespace passage_core
