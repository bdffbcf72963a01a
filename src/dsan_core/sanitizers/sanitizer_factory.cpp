#include "dsan_core/sanitizers/sanitizer_factory.hpp"
#include "dsan_core/sanitizers/docx_sanitizer.hpp"
#include "dsan_core/sanitizers/image_sanitizer.hpp"
#include "dsan_core/sanitizers/pdf_sanitizer.hpp"

namespace dsan_core {
SanitizerFactory::SanitizerFactory(std::shared_ptr<Logger> logger, const SanitizerConfig& config) {
    sanitizers.push_back(std::make_unique<PdfSanitizer>(logger, config.strip_xmp));
    sanitizers.push_back(std::make_unique<DocxSanitizer>(logger));
    sanitizers.push_back(std::make_unique<ImageSanitizer>(logger));
}

const MetadataSanitizer* SanitizerFactory::find_sanitizer_for(
    const std::filesystem::path& file_path) const {
    for (const auto& sanitizer : sanitizers) {
        if (sanitizer->can_handle(file_path)) {
            return sanitizer.get();
        }
    }
    return nullptr;
}
}
