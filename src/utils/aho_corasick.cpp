#include "aho_corasick.hpp"

#include <cstddef>
#include <queue>

namespace Utils {

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns) {
  trie_.emplace_back(); // Root node

  for (const auto &pattern : patterns) {
    if (pattern.empty())
      continue;

    int node = 0;
    for (char ch : pattern) {
      auto it = trie_[node].children.find(ch);
      if (it == trie_[node].children.end()) {
        int next = static_cast<int>(trie_.size());
        trie_[node].children[ch] = next;
        trie_.emplace_back();
        node = next;
      } else {
        node = it->second;
      }
    }
    trie_[node].pattern_indices.push_back(static_cast<int>(patterns_.size()));
    patterns_.push_back(pattern);
  }

  // Suffix and output links, breadth first so shallower nodes are final
  // before their descendants read them
  std::queue<int> pending;
  for (auto const &[ch, child] : trie_[0].children)
    pending.push(child);

  while (!pending.empty()) {
    int u = pending.front();
    pending.pop();

    int suffix_node = trie_[u].suffix_link;
    trie_[u].output_link = trie_[suffix_node].pattern_indices.empty()
                               ? trie_[suffix_node].output_link
                               : suffix_node;

    for (auto const &[ch, v] : trie_[u].children) {
      int j = trie_[u].suffix_link;
      while (j > 0 && trie_[j].children.count(ch) == 0)
        j = trie_[j].suffix_link;

      auto it = trie_[j].children.find(ch);
      if (it != trie_[j].children.end() && it->second != v)
        trie_[v].suffix_link = it->second;
      pending.push(v);
    }
  }
}

int AhoCorasick::step(int node, char ch) const {
  while (node > 0 && trie_[node].children.count(ch) == 0)
    node = trie_[node].suffix_link;

  auto it = trie_[node].children.find(ch);
  return it == trie_[node].children.end() ? 0 : it->second;
}

std::vector<std::string> AhoCorasick::find_all(std::string_view text) const {
  std::vector<std::string> found_patterns;
  int current_node = 0;

  for (char ch : text) {
    current_node = step(current_node, ch);

    for (int node = current_node; node > 0; node = trie_[node].output_link) {
      for (int pattern_idx : trie_[node].pattern_indices)
        found_patterns.push_back(patterns_[pattern_idx]);
    }
  }
  return found_patterns;
}

std::optional<std::string>
AhoCorasick::find_first(std::string_view text) const {
  int current_node = 0;

  for (char ch : text) {
    current_node = step(current_node, ch);

    for (int node = current_node; node > 0; node = trie_[node].output_link) {
      if (!trie_[node].pattern_indices.empty())
        return patterns_[trie_[node].pattern_indices.front()];
    }
  }
  return std::nullopt;
}

} // namespace Utils
