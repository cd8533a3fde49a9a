#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pricematch::matching {

/// BERT-style uncased WordPiece tokenizer for sentence-embedding models.
/// Vocabulary is a vocab.txt file, one token per line, id = line number.
class WordPieceTokenizer {
 public:
  /// Throws std::runtime_error if the vocabulary cannot be read or lacks
  /// [CLS], [SEP], [UNK] or [PAD].
  explicit WordPieceTokenizer(const std::filesystem::path& vocab_path,
                              std::size_t max_length = 128);

  /// Build from an in-memory vocabulary (token -> id).
  WordPieceTokenizer(std::unordered_map<std::string, std::int64_t> vocab,
                     std::size_t max_length);

  /// [CLS] tokens... [SEP], truncated to max_length ids.
  [[nodiscard]] std::vector<std::int64_t> encode(std::string_view text) const;

  [[nodiscard]] std::int64_t pad_id() const noexcept { return pad_id_; }
  [[nodiscard]] std::size_t vocab_size() const noexcept { return vocab_.size(); }
  [[nodiscard]] std::size_t max_length() const noexcept { return max_length_; }

 private:
  void init_special_tokens();
  void append_word_pieces(const std::string& word, std::vector<std::int64_t>& out) const;

  std::unordered_map<std::string, std::int64_t> vocab_;
  std::size_t max_length_;
  std::int64_t cls_id_{0};
  std::int64_t sep_id_{0};
  std::int64_t unk_id_{0};
  std::int64_t pad_id_{0};
};

}  // namespace pricematch::matching
