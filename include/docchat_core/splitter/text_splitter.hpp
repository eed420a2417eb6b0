#pragma once

#include <string>
#include <vector>

#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

struct SplitterOptions {
  // Both measured in Unicode code points
  int chunk_size = 1000;
  int chunk_overlap = 200;
  // Tried in order: paragraph, line, sentence, word, hard cut
  std::vector<std::string> separators = {"\n\n", "\n", ". ", " ", ""};
  bool fingerprint_includes_source = false;
};

/**
 * @class TextSplitter
 * @brief Splits loaded documents into overlapping, size-bounded chunks.
 *
 * Text is split on the first separator that occurs in it. Pieces shorter than
 * chunk_size are merged with their neighbours, longer pieces are split again
 * with the next separator. The empty separator cuts between code points, so
 * every chunk ends up within chunk_size. Output is fully deterministic.
 */
class TextSplitter {
 public:
  /**
   * @throw ConfigurationError if either size is non-positive or
   *        chunk_overlap >= chunk_size.
   */
  explicit TextSplitter(SplitterOptions options = {});

  std::vector<Chunk> split(const std::vector<LoadedDocument> &documents) const;

  // Splits one text, returning the chunk strings only
  std::vector<std::string> split_text(const std::string &text) const;

  const SplitterOptions &options() const {
    return options_;
  }

 private:
  using Text = std::u32string;

  std::vector<Text> split_recursive(const Text &text, size_t separator_pos) const;
  std::vector<Text> merge_splits(const std::vector<Text> &splits) const;
  static std::vector<Text> split_keep_separator(const Text &text, const Text &separator);
  static Text strip(const Text &text);

  SplitterOptions options_;
  std::vector<Text> separators_;
};

}  // namespace docchat_core
