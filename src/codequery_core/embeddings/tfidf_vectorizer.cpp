#include "codequery_core/embeddings/tfidf_vectorizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_set>

#include "codequery_core/embeddings/embedding_provider.hpp"

namespace codequery_core {

namespace {

const std::unordered_set<std::string> &english_stop_words() {
  static const std::unordered_set<std::string> words = {
      "a", "about", "above", "across", "after", "afterwards", "again", "against", "all",
      "almost", "alone", "along", "already", "also", "although", "always", "am", "among",
      "amongst", "amoungst", "amount", "an", "and", "another", "any", "anyhow", "anyone",
      "anything", "anyway", "anywhere", "are", "around", "as", "at", "back", "be", "became",
      "because", "become", "becomes", "becoming", "been", "before", "beforehand", "behind",
      "being", "below", "beside", "besides", "between", "beyond", "bill", "both", "bottom",
      "but", "by", "call", "can", "cannot", "cant", "co", "con", "could", "couldnt", "cry",
      "de", "describe", "detail", "do", "done", "down", "due", "during", "each", "eg",
      "eight", "either", "eleven", "else", "elsewhere", "empty", "enough", "etc", "even",
      "ever", "every", "everyone", "everything", "everywhere", "except", "few", "fifteen",
      "fifty", "fill", "find", "fire", "first", "five", "for", "former", "formerly", "forty",
      "found", "four", "from", "front", "full", "further", "get", "give", "go", "had", "has",
      "hasnt", "have", "he", "hence", "her", "here", "hereafter", "hereby", "herein",
      "hereupon", "hers", "herself", "him", "himself", "his", "how", "however", "hundred",
      "i", "ie", "if", "in", "inc", "indeed", "interest", "into", "is", "it", "its", "itself",
      "keep", "last", "latter", "latterly", "least", "less", "ltd", "made", "many", "may",
      "me", "meanwhile", "might", "mill", "mine", "more", "moreover", "most", "mostly",
      "move", "much", "must", "my", "myself", "name", "namely", "neither", "never",
      "nevertheless", "next", "nine", "no", "nobody", "none", "noone", "nor", "not",
      "nothing", "now", "nowhere", "of", "off", "often", "on", "once", "one", "only", "onto",
      "or", "other", "others", "otherwise", "our", "ours", "ourselves", "out", "over", "own",
      "part", "per", "perhaps", "please", "put", "rather", "re", "same", "see", "seem",
      "seemed", "seeming", "seems", "serious", "several", "she", "should", "show", "side",
      "since", "sincere", "six", "sixty", "so", "some", "somehow", "someone", "something",
      "sometime", "sometimes", "somewhere", "still", "such", "system", "take", "ten", "than",
      "that", "the", "their", "them", "themselves", "then", "thence", "there", "thereafter",
      "thereby", "therefore", "therein", "thereupon", "these", "they", "thick", "thin",
      "third", "this", "those", "though", "three", "through", "throughout", "thru", "thus",
      "to", "together", "too", "top", "toward", "towards", "twelve", "twenty", "two", "un",
      "under", "until", "up", "upon", "us", "very", "via", "was", "we", "well", "were",
      "what", "whatever", "when", "whence", "whenever", "where", "whereafter", "whereas",
      "whereby", "wherein", "whereupon", "wherever", "whether", "which", "while", "whither",
      "who", "whoever", "whole", "whom", "whose", "why", "will", "with", "within", "without",
      "would", "yet", "you", "your", "yours", "yourself", "yourselves"};
  return words;
}

bool is_word_byte(unsigned char c) {
  return std::isalnum(c) || c == '_' || c >= 0x80;
}

void normalize(SparseRow &row) {
  double norm = 0.0;
  for (const auto &[column, weight] : row) {
    norm += static_cast<double>(weight) * weight;
  }
  if (norm <= 0.0) {
    return;
  }
  const double scale = 1.0 / std::sqrt(norm);
  for (auto &entry : row) {
    entry.second = static_cast<float>(entry.second * scale);
  }
}

}  // namespace

TfidfVectorizer::TfidfVectorizer(int max_features) : max_features_(max_features) {
  if (max_features_ <= 0) {
    throw EmbeddingProviderError("max_features must be greater than 0");
  }
}

std::vector<std::string> TfidfVectorizer::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    if (current.size() >= 2 && !is_stop_word(current)) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (is_word_byte(c)) {
      current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

bool TfidfVectorizer::is_stop_word(const std::string &token) {
  return english_stop_words().count(token) > 0;
}

std::vector<SparseRow> TfidfVectorizer::fit_transform(const std::vector<std::string> &texts) {
  std::map<std::string, long long> corpus_counts;
  std::map<std::string, int> document_frequency;

  for (const auto &text : texts) {
    std::unordered_set<std::string> seen;
    for (auto &token : tokenize(text)) {
      corpus_counts[token]++;
      if (seen.insert(token).second) {
        document_frequency[token]++;
      }
    }
  }

  if (corpus_counts.empty()) {
    throw EmbeddingProviderError("Empty vocabulary; the texts contain only stop words or no words");
  }

  // Highest corpus frequency first, alphabetical among equals
  std::vector<std::pair<std::string, long long>> ranked(corpus_counts.begin(), corpus_counts.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  if (ranked.size() > static_cast<std::size_t>(max_features_)) {
    ranked.resize(max_features_);
  }

  terms_.clear();
  for (const auto &[term, count] : ranked) {
    terms_.push_back(term);
  }
  std::sort(terms_.begin(), terms_.end());

  const double n = static_cast<double>(texts.size());
  vocabulary_.clear();
  idf_.assign(terms_.size(), 0.0f);
  for (std::size_t column = 0; column < terms_.size(); ++column) {
    vocabulary_[terms_[column]] = static_cast<int>(column);
    const double df = document_frequency[terms_[column]];
    idf_[column] = static_cast<float>(std::log((1.0 + n) / (1.0 + df)) + 1.0);
  }

  return transform(texts);
}

std::vector<SparseRow> TfidfVectorizer::transform(const std::vector<std::string> &texts) const {
  if (!fitted()) {
    throw EmbeddingProviderError("TF-IDF vectorizer used before fitting");
  }
  std::vector<SparseRow> rows;
  rows.reserve(texts.size());
  for (const auto &text : texts) {
    rows.push_back(transform_one(text));
  }
  return rows;
}

SparseRow TfidfVectorizer::transform_one(const std::string &text) const {
  std::map<int, int> term_counts;
  for (const auto &token : tokenize(text)) {
    auto it = vocabulary_.find(token);
    if (it != vocabulary_.end()) {
      term_counts[it->second]++;
    }
  }

  SparseRow row;
  row.reserve(term_counts.size());
  for (const auto &[column, count] : term_counts) {
    row.emplace_back(column, static_cast<float>(count) * idf_[column]);
  }
  normalize(row);
  return row;
}

std::vector<VocabularyEntry> TfidfVectorizer::export_vocabulary() const {
  std::vector<VocabularyEntry> entries;
  entries.reserve(terms_.size());
  for (std::size_t column = 0; column < terms_.size(); ++column) {
    entries.push_back({terms_[column], static_cast<int>(column), idf_[column]});
  }
  return entries;
}

void TfidfVectorizer::import_vocabulary(const std::vector<VocabularyEntry> &entries) {
  std::vector<std::string> terms(entries.size());
  std::vector<float> idf(entries.size(), 0.0f);
  std::unordered_map<std::string, int> vocabulary;

  for (const auto &entry : entries) {
    if (entry.column < 0 || entry.column >= static_cast<int>(entries.size()) ||
        !terms[entry.column].empty()) {
      throw EmbeddingProviderError("Stored vocabulary has an invalid column for term '" +
                                   entry.term + "'");
    }
    terms[entry.column] = entry.term;
    idf[entry.column] = entry.idf;
    vocabulary[entry.term] = entry.column;
  }

  terms_ = std::move(terms);
  idf_ = std::move(idf);
  vocabulary_ = std::move(vocabulary);
}

}  // namespace codequery_core
