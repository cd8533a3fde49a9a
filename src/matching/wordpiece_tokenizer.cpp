#include <pricematch/matching/wordpiece_tokenizer.hpp>
#include "core/text_utils.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace pricematch::matching {

namespace {

constexpr std::size_t kMaxCharsPerWord = 100;

bool is_punct(unsigned char c) {
  return c < 0x80 && std::ispunct(c) != 0;
}

/// Lowercase, split on whitespace, and make each ASCII punctuation mark its own word.
std::vector<std::string> basic_tokenize(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : core::detail::to_lower(text)) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c) != 0) {
      if (!current.empty()) words.push_back(std::move(current));
      current.clear();
    } else if (is_punct(c)) {
      if (!current.empty()) words.push_back(std::move(current));
      current.clear();
      words.emplace_back(1, ch);
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

}  // namespace

WordPieceTokenizer::WordPieceTokenizer(const std::filesystem::path& vocab_path,
                                       std::size_t max_length)
    : max_length_(max_length) {
  std::ifstream f(vocab_path);
  if (!f) {
    throw std::runtime_error("WordPieceTokenizer: cannot open vocabulary " + vocab_path.string());
  }
  std::string line;
  std::int64_t id = 0;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    vocab_.emplace(line, id++);
  }
  init_special_tokens();
}

WordPieceTokenizer::WordPieceTokenizer(std::unordered_map<std::string, std::int64_t> vocab,
                                       std::size_t max_length)
    : vocab_(std::move(vocab)), max_length_(max_length) {
  init_special_tokens();
}

void WordPieceTokenizer::init_special_tokens() {
  const auto lookup = [this](const char* token) {
    const auto it = vocab_.find(token);
    if (it == vocab_.end()) {
      throw std::runtime_error(std::string("WordPieceTokenizer: vocabulary lacks ") + token);
    }
    return it->second;
  };
  cls_id_ = lookup("[CLS]");
  sep_id_ = lookup("[SEP]");
  unk_id_ = lookup("[UNK]");
  pad_id_ = lookup("[PAD]");
  if (max_length_ < 2) max_length_ = 2;
}

void WordPieceTokenizer::append_word_pieces(const std::string& word,
                                            std::vector<std::int64_t>& out) const {
  if (word.size() > kMaxCharsPerWord) {
    out.push_back(unk_id_);
    return;
  }
  std::vector<std::int64_t> pieces;
  std::size_t start = 0;
  while (start < word.size()) {
    std::size_t end = word.size();
    std::int64_t found = -1;
    while (start < end) {
      std::string piece = word.substr(start, end - start);
      if (start > 0) piece.insert(0, "##");
      if (const auto it = vocab_.find(piece); it != vocab_.end()) {
        found = it->second;
        break;
      }
      --end;
    }
    if (found < 0) {
      out.push_back(unk_id_);
      return;
    }
    pieces.push_back(found);
    start = end;
  }
  out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<std::int64_t> WordPieceTokenizer::encode(std::string_view text) const {
  std::vector<std::int64_t> ids{cls_id_};
  for (const auto& word : basic_tokenize(text)) {
    append_word_pieces(word, ids);
    if (ids.size() >= max_length_ - 1) break;
  }
  if (ids.size() > max_length_ - 1) ids.resize(max_length_ - 1);
  ids.push_back(sep_id_);
  return ids;
}

}  // namespace pricematch::matching
