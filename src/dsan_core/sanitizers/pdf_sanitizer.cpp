#include "dsan_core/sanitizers/pdf_sanitizer.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>

namespace dsan_core {

PdfSanitizer::PdfSanitizer(std::shared_ptr<Logger> logger, bool strip_xmp)
    : MetadataSanitizer(std::move(logger)), strip_xmp_(strip_xmp) {}

bool PdfSanitizer::can_handle(const fs::path& file_path) const {
  return normalized_extension(file_path) == ".pdf";
}

/**
 * @brief Copies every page into an empty document and writes that document.
 *
 * The new document starts from QPDF::emptyPDF(), so its trailer never carries the
 * source's /Info dictionary and its catalog never carries the source's /Metadata
 * stream. Both keys are still removed explicitly before writing. Pages keep their
 * content streams and resources unchanged.
 */
void PdfSanitizer::sanitize(const fs::path& source, const fs::path& destination) const {
  try {
    QPDF input;
    input.setSuppressWarnings(true);
    input.processFile(source.string().c_str());

    // The input must stay alive until the writer has copied its pages out.
    QPDF output;
    output.emptyPDF();

    size_t page_count = 0;
    for (const auto& page : input.getAllPages()) {
      output.addPage(page, false);
      page_count++;
    }

    output.getTrailer().removeKey("/Info");
    output.getRoot().removeKey("/Metadata");

    if (strip_xmp_) {
      for (auto page : output.getAllPages()) {
        page.removeKey("/Metadata");
        page.removeKey("/PieceInfo");
      }
    } else {
      logger_->debug("Keeping page-level XMP streams in " + source.string());
    }

    for (const auto& warning : input.getWarnings()) {
      logger_->debug("qpdf warning for " + source.string() + ": " + warning.what());
    }

    QPDFWriter writer(output, destination.string().c_str());
    writer.write();

    logger_->debug("Copied " + std::to_string(page_count) + " page(s) from " + source.string());
  } catch (const std::exception& e) {
    remove_partial_output(destination);
    throw SanitizerError(std::string("PDF processing failed: ") + e.what());
  }
}

}  // namespace dsan_core
