#include "docchat_core/splitter/text_splitter.hpp"

#include <utf8.h>

#include <deque>
#include <iterator>

#include "docchat_core/errors.hpp"
#include "docchat_core/splitter/fingerprint.hpp"

namespace docchat_core {

namespace {

std::u32string to_u32(const std::string &text) {
  std::u32string out;
  if (utf8::is_valid(text.begin(), text.end())) {
    utf8::utf8to32(text.begin(), text.end(), std::back_inserter(out));
  } else {
    std::string repaired;
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
    utf8::utf8to32(repaired.begin(), repaired.end(), std::back_inserter(out));
  }
  return out;
}

std::string to_utf8(const std::u32string &text) {
  std::string out;
  utf8::utf32to8(text.begin(), text.end(), std::back_inserter(out));
  return out;
}

bool is_space(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v';
}

}  // namespace

TextSplitter::TextSplitter(SplitterOptions options) : options_(std::move(options)) {
  if (options_.chunk_size <= 0) {
    throw ConfigurationError("chunk_size must be positive, got " +
                             std::to_string(options_.chunk_size));
  }
  if (options_.chunk_overlap <= 0) {
    throw ConfigurationError("chunk_overlap must be positive, got " +
                             std::to_string(options_.chunk_overlap));
  }
  if (options_.chunk_overlap >= options_.chunk_size) {
    throw ConfigurationError("chunk_overlap (" + std::to_string(options_.chunk_overlap) +
                             ") must be smaller than chunk_size (" +
                             std::to_string(options_.chunk_size) + ")");
  }

  // The hard cut must always be available as the last resort
  if (options_.separators.empty() || !options_.separators.back().empty()) {
    options_.separators.push_back("");
  }
  for (const auto &separator : options_.separators) {
    separators_.push_back(to_u32(separator));
  }
}

std::vector<Chunk> TextSplitter::split(const std::vector<LoadedDocument> &documents) const {
  std::vector<Chunk> chunks;
  const size_t overlap = static_cast<size_t>(options_.chunk_overlap);

  for (const auto &document : documents) {
    Text text = to_u32(document.text);
    std::vector<Text> pieces = split_recursive(text, 0);

    size_t index = 0;
    size_t previous_length = 0;
    int chunk_index = 0;
    for (const auto &piece : pieces) {
      size_t search_from = index + previous_length > overlap ? index + previous_length - overlap : 0;
      size_t found = text.find(piece, search_from);
      if (found == Text::npos) {
        found = text.find(piece, index);
      }
      if (found != Text::npos) {
        index = found;
      } else {
        index = search_from;
      }
      previous_length = piece.size();

      Chunk chunk;
      chunk.content = to_utf8(piece);
      chunk.source_id = document.source_id;
      chunk.chunk_index = chunk_index++;
      chunk.start_offset = index;
      chunk.fingerprint = compute_fingerprint(chunk.content, chunk.source_id,
                                              options_.fingerprint_includes_source);
      chunks.push_back(std::move(chunk));
    }
  }
  return chunks;
}

std::vector<std::string> TextSplitter::split_text(const std::string &text) const {
  std::vector<std::string> out;
  for (const auto &piece : split_recursive(to_u32(text), 0)) {
    out.push_back(to_utf8(piece));
  }
  return out;
}

std::vector<TextSplitter::Text> TextSplitter::split_recursive(const Text &text,
                                                             size_t separator_pos) const {
  // Pick the first separator that actually occurs in this text
  size_t chosen = separators_.size() - 1;
  for (size_t i = separator_pos; i < separators_.size(); ++i) {
    if (separators_[i].empty() || text.find(separators_[i]) != Text::npos) {
      chosen = i;
      break;
    }
  }
  const size_t next_pos = chosen + 1;
  const size_t chunk_size = static_cast<size_t>(options_.chunk_size);

  std::vector<Text> final_chunks;
  std::vector<Text> good_splits;
  for (auto &piece : split_keep_separator(text, separators_[chosen])) {
    if (piece.size() < chunk_size) {
      good_splits.push_back(std::move(piece));
      continue;
    }

    if (!good_splits.empty()) {
      auto merged = merge_splits(good_splits);
      final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
      good_splits.clear();
    }

    if (next_pos >= separators_.size()) {
      Text stripped = strip(piece);
      if (!stripped.empty()) {
        final_chunks.push_back(std::move(stripped));
      }
    } else {
      auto sub_chunks = split_recursive(piece, next_pos);
      final_chunks.insert(final_chunks.end(), sub_chunks.begin(), sub_chunks.end());
    }
  }

  if (!good_splits.empty()) {
    auto merged = merge_splits(good_splits);
    final_chunks.insert(final_chunks.end(), merged.begin(), merged.end());
  }
  return final_chunks;
}

/*
Greedily packs consecutive pieces into chunks of at most chunk_size. After a
chunk is emitted, pieces are dropped from the front of the window until what
remains fits in chunk_overlap, and that remainder opens the next chunk.
*/
std::vector<TextSplitter::Text> TextSplitter::merge_splits(const std::vector<Text> &splits) const {
  const size_t chunk_size = static_cast<size_t>(options_.chunk_size);
  const size_t chunk_overlap = static_cast<size_t>(options_.chunk_overlap);

  std::vector<Text> docs;
  std::deque<const Text *> window;
  size_t total = 0;

  auto emit = [&]() {
    Text joined;
    for (const Text *piece : window) {
      joined += *piece;
    }
    Text stripped = strip(joined);
    if (!stripped.empty()) {
      docs.push_back(std::move(stripped));
    }
  };

  for (const auto &piece : splits) {
    const size_t length = piece.size();
    if (total + length > chunk_size && !window.empty()) {
      emit();
      while (total > chunk_overlap || (total + length > chunk_size && total > 0)) {
        total -= window.front()->size();
        window.pop_front();
      }
    }
    window.push_back(&piece);
    total += length;
  }

  if (!window.empty()) {
    emit();
  }
  return docs;
}

// Separator stays attached to the end of the piece it terminates
std::vector<TextSplitter::Text> TextSplitter::split_keep_separator(const Text &text,
                                                                  const Text &separator) {
  std::vector<Text> pieces;
  if (separator.empty()) {
    pieces.reserve(text.size());
    for (char32_t c : text) {
      pieces.emplace_back(1, c);
    }
    return pieces;
  }

  size_t start = 0;
  while (start < text.size()) {
    size_t pos = text.find(separator, start);
    if (pos == Text::npos) {
      pieces.push_back(text.substr(start));
      break;
    }
    size_t end = pos + separator.size();
    pieces.push_back(text.substr(start, end - start));
    start = end;
  }
  return pieces;
}

TextSplitter::Text TextSplitter::strip(const Text &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace docchat_core
