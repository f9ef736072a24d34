#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * This factory holds a collection of all available content extractors and
 * selects one based on the file's extension. This class is non-copyable and
 * non-movable.
 */
namespace passage_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and initializes all available extractors.
   */
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds and returns the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw ContentExtractorError if no suitable extractor is found.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  // True when some extractor accepts the file; used to filter directory scans
  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace passage_core
