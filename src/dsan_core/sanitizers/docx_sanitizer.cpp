#include "dsan_core/sanitizers/docx_sanitizer.hpp"

#include <zip.h>

#include <array>
#include <deque>
#include <pugixml.hpp>
#include <sstream>
#include <string_view>
#include <vector>

namespace dsan_core {

namespace {

constexpr std::string_view kDocumentPart = "word/document.xml";
constexpr std::string_view kCorePropertiesPart = "docProps/core.xml";

// Local names inside docProps/core.xml; dc:description holds the "comments" property
constexpr std::array<std::string_view, 9> kCoreProperties = {
    "creator", "title", "subject", "keywords", "description",
    "lastModifiedBy", "created", "modified", "lastPrinted"};

// Comment bodies plus their anchors in the main story, headers, footers and notes
constexpr std::array<std::string_view, 4> kCommentElements = {
    "comment", "commentRangeStart", "commentRangeEnd", "commentReference"};

// Parts that describe comment threads and comment authors
constexpr std::array<std::string_view, 4> kCommentSideParts = {
    "word/commentsExtended.xml", "word/commentsIds.xml", "word/commentsExtensible.xml",
    "word/people.xml"};

constexpr unsigned int kParseOptions =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

struct ZipDiscard {
  void operator()(zip_t* archive) const {
    if (archive) zip_discard(archive);
  }
};
using ZipArchivePtr = std::unique_ptr<zip_t, ZipDiscard>;

std::string zip_error_message(int code) {
  zip_error_t error;
  zip_error_init_with_code(&error, code);
  std::string message = zip_error_strerror(&error);
  zip_error_fini(&error);
  return message;
}

std::string read_entry(zip_t* archive, zip_uint64_t index, const std::string& name) {
  zip_stat_t entry_stat;
  zip_stat_init(&entry_stat);
  if (zip_stat_index(archive, index, 0, &entry_stat) != 0) {
    throw SanitizerError("Cannot stat package entry " + name + ": " + zip_strerror(archive));
  }

  zip_file_t* entry = zip_fopen_index(archive, index, 0);
  if (!entry) {
    throw SanitizerError("Cannot open package entry " + name + ": " + zip_strerror(archive));
  }

  std::string contents(entry_stat.size, '\0');
  zip_int64_t bytes_read = 0;
  if (entry_stat.size > 0) {
    bytes_read = zip_fread(entry, contents.data(), entry_stat.size);
  }
  zip_fclose(entry);

  if (bytes_read < 0 || static_cast<zip_uint64_t>(bytes_read) != entry_stat.size) {
    throw SanitizerError("Short read on package entry " + name);
  }
  return contents;
}

std::string_view local_name(const pugi::xml_node& node) {
  std::string_view name = node.name();
  const auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

template <size_t N>
bool matches(const pugi::xml_node& node, const std::array<std::string_view, N>& names) {
  const std::string_view name = local_name(node);
  for (const auto& candidate : names) {
    if (candidate == name) return true;
  }
  return false;
}

template <size_t N>
void collect_elements(const pugi::xml_node& node,
                      const std::array<std::string_view, N>& names,
                      std::vector<pugi::xml_node>& found) {
  for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) continue;
    if (matches(child, names)) {
      found.push_back(child);
    } else {
      collect_elements(child, names, found);
    }
  }
}

template <size_t N>
size_t remove_elements(pugi::xml_node root, const std::array<std::string_view, N>& names) {
  std::vector<pugi::xml_node> doomed;
  collect_elements(root, names, doomed);
  for (auto& node : doomed) {
    node.parent().remove_child(node);
  }
  return doomed.size();
}

size_t remove_children(pugi::xml_node root) {
  size_t removed = 0;
  while (pugi::xml_node child = root.first_child()) {
    if (child.type() == pugi::node_element) removed++;
    root.remove_child(child);
  }
  return removed;
}

bool is_word_xml_part(const std::string& part_name) {
  return part_name.rfind("word/", 0) == 0 && part_name.size() > 4 &&
         part_name.compare(part_name.size() - 4, 4, ".xml") == 0;
}

bool is_comment_side_part(const std::string& part_name) {
  for (const auto& candidate : kCommentSideParts) {
    if (candidate == part_name) return true;
  }
  return false;
}

std::string serialize(const pugi::xml_document& doc) {
  std::ostringstream out;
  doc.save(out, "", pugi::format_raw);
  return out.str();
}

}  // namespace

DocxSanitizer::DocxSanitizer(std::shared_ptr<Logger> logger)
    : MetadataSanitizer(std::move(logger)) {}

bool DocxSanitizer::can_handle(const fs::path& file_path) const {
  return normalized_extension(file_path) == ".docx";
}

std::string DocxSanitizer::clean_part(const std::string& part_name,
                                      const std::string& content,
                                      DocxCleanupStats& stats) const {
  const bool core_part = part_name == kCorePropertiesPart;
  const bool side_part = is_comment_side_part(part_name);
  if (!core_part && !side_part && !is_word_xml_part(part_name)) {
    return content;
  }

  pugi::xml_document doc;
  pugi::xml_parse_result parsed = doc.load_buffer(content.data(), content.size(), kParseOptions);
  if (!parsed) {
    throw SanitizerError("Malformed XML in " + part_name + ": " + parsed.description());
  }

  size_t removed = 0;
  if (core_part) {
    removed = remove_elements(doc.document_element(), kCoreProperties);
    stats.core_properties_removed += removed;
  } else if (side_part) {
    removed = remove_children(doc.document_element());
    stats.comment_nodes_removed += removed;
  } else {
    removed = remove_elements(doc.document_element(), kCommentElements);
    stats.comment_nodes_removed += removed;
  }

  if (removed == 0) {
    return content;
  }
  stats.parts_rewritten++;
  return serialize(doc);
}

void DocxSanitizer::sanitize(const fs::path& source, const fs::path& destination) const {
  int error_code = 0;
  ZipArchivePtr input(zip_open(source.string().c_str(), ZIP_RDONLY, &error_code));
  if (!input) {
    throw SanitizerError("Cannot open DOCX package " + source.string() + ": " +
                         zip_error_message(error_code));
  }

  if (zip_name_locate(input.get(), std::string(kDocumentPart).c_str(), 0) < 0) {
    throw SanitizerError("Not a DOCX package (missing " + std::string(kDocumentPart) + "): " +
                         source.string());
  }

  try {
    ZipArchivePtr output(
        zip_open(destination.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code));
    if (!output) {
      throw SanitizerError("Cannot create " + destination.string() + ": " +
                           zip_error_message(error_code));
    }

    // libzip reads buffer sources at zip_close(), so every payload must outlive it
    std::deque<std::string> payloads;
    DocxCleanupStats stats;

    const zip_int64_t entry_count = zip_get_num_entries(input.get(), 0);
    for (zip_int64_t i = 0; i < entry_count; ++i) {
      const auto index = static_cast<zip_uint64_t>(i);
      const char* raw_name = zip_get_name(input.get(), index, 0);
      if (!raw_name) {
        throw SanitizerError("Unnamed package entry at index " + std::to_string(i));
      }
      const std::string name = raw_name;

      if (!name.empty() && name.back() == '/') {
        if (zip_dir_add(output.get(), name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
          throw SanitizerError("Cannot add directory " + name + ": " + zip_strerror(output.get()));
        }
        continue;
      }

      payloads.push_back(clean_part(name, read_entry(input.get(), index, name), stats));
      const std::string& payload = payloads.back();

      zip_source_t* entry_source =
          zip_source_buffer(output.get(), payload.data(), payload.size(), 0);
      if (!entry_source) {
        throw SanitizerError("Cannot stage entry " + name + ": " + zip_strerror(output.get()));
      }
      if (zip_file_add(output.get(), name.c_str(), entry_source, ZIP_FL_ENC_UTF_8) < 0) {
        zip_source_free(entry_source);
        throw SanitizerError("Cannot add entry " + name + ": " + zip_strerror(output.get()));
      }
    }

    if (zip_close(output.get()) != 0) {
      throw SanitizerError("Cannot write " + destination.string() + ": " +
                           zip_strerror(output.get()));
    }
    // zip_close freed the archive
    output.release();

    logger_->debug("Removed " + std::to_string(stats.core_properties_removed) +
                   " core propert(ies) and " + std::to_string(stats.comment_nodes_removed) +
                   " comment node(s) across " + std::to_string(stats.parts_rewritten) +
                   " part(s) of " + source.string());
  } catch (const SanitizerError&) {
    remove_partial_output(destination);
    throw;
  } catch (const std::exception& e) {
    remove_partial_output(destination);
    throw SanitizerError(std::string("DOCX processing failed: ") + e.what());
  }
}

}  // namespace dsan_core
