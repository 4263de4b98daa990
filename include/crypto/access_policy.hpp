#pragma once
#include "utils/error_codes.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace hierfed {

// Threshold-gate policy tree: AND is n-of-n, OR is 1-of-n, leaves name one
// attribute.
struct PolicyNode {
  int threshold = 1;
  std::string attribute; // leaves only
  std::vector<std::shared_ptr<const PolicyNode>> children;

  bool isLeaf() const { return children.empty(); }
  bool isAnd() const {
    return !isLeaf() && threshold == static_cast<int>(children.size());
  }

  static std::shared_ptr<const PolicyNode> leaf(std::string attribute);
  static std::shared_ptr<const PolicyNode>
  gate(int threshold, std::vector<std::shared_ptr<const PolicyNode>> children);
};

// Parsed access policy such as `facility AND (region:north OR region:south)`.
// AND binds tighter than OR; attributes may be bare or double-quoted.
class AccessPolicy {
public:
  AccessPolicy() = default;

  static Result<AccessPolicy> parse(const std::string &expression);

  bool isSatisfiedBy(const std::set<std::string> &attributes) const;

  // Every attribute named by a leaf, in depth-first order (may repeat)
  std::vector<std::string> leafAttributes() const;

  const std::string &expression() const { return expression_; }
  const std::shared_ptr<const PolicyNode> &root() const { return root_; }

private:
  std::string expression_;
  std::shared_ptr<const PolicyNode> root_;
};

} // namespace hierfed
