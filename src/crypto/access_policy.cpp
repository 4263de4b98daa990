#include "crypto/access_policy.hpp"
#include <algorithm>
#include <cctype>
#include <functional>

namespace hierfed {

namespace {

enum class TokenKind { Attribute, And, Or, LParen, RParen, End };

struct Token {
  TokenKind kind;
  std::string text;
};

bool isAttributeChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' ||
         c == '.' || c == '=' || c == '-';
}

Result<std::vector<Token>> tokenize(const std::string &expression) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < expression.size()) {
    char c = expression[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
    } else if (c == '(') {
      tokens.push_back({TokenKind::LParen, "("});
      ++i;
    } else if (c == ')') {
      tokens.push_back({TokenKind::RParen, ")"});
      ++i;
    } else if (c == '"') {
      size_t close = expression.find('"', i + 1);
      if (close == std::string::npos || close == i + 1) {
        return Result<std::vector<Token>>(ErrorCode::CryptoInvalidPolicy,
                                          "unterminated or empty quoted attribute");
      }
      tokens.push_back(
          {TokenKind::Attribute, expression.substr(i + 1, close - i - 1)});
      i = close + 1;
    } else if (isAttributeChar(c)) {
      size_t start = i;
      while (i < expression.size() && isAttributeChar(expression[i])) {
        ++i;
      }
      std::string word = expression.substr(start, i - start);
      if (word == "AND" || word == "and") {
        tokens.push_back({TokenKind::And, word});
      } else if (word == "OR" || word == "or") {
        tokens.push_back({TokenKind::Or, word});
      } else {
        tokens.push_back({TokenKind::Attribute, word});
      }
    } else {
      return Result<std::vector<Token>>(
          ErrorCode::CryptoInvalidPolicy,
          std::string("unexpected character '") + c + "' in policy");
    }
  }
  tokens.push_back({TokenKind::End, ""});
  return tokens;
}

class PolicyParser {
public:
  explicit PolicyParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  std::shared_ptr<const PolicyNode> parseExpression() {
    std::vector<std::shared_ptr<const PolicyNode>> terms{parseTerm()};
    while (ok() && peek().kind == TokenKind::Or) {
      ++pos_;
      terms.push_back(parseTerm());
    }
    if (terms.size() == 1) {
      return terms.front();
    }
    return PolicyNode::gate(1, flatten(std::move(terms), false));
  }

  bool atEnd() const { return peek().kind == TokenKind::End; }
  bool ok() const { return error_.empty(); }
  const std::string &error() const { return error_; }

private:
  std::shared_ptr<const PolicyNode> parseTerm() {
    std::vector<std::shared_ptr<const PolicyNode>> factors{parseFactor()};
    while (ok() && peek().kind == TokenKind::And) {
      ++pos_;
      factors.push_back(parseFactor());
    }
    if (factors.size() == 1) {
      return factors.front();
    }
    auto flat = flatten(std::move(factors), true);
    int n = static_cast<int>(flat.size());
    return PolicyNode::gate(n, std::move(flat));
  }

  std::shared_ptr<const PolicyNode> parseFactor() {
    if (!ok()) {
      return nullptr;
    }
    const Token &token = peek();
    if (token.kind == TokenKind::Attribute) {
      ++pos_;
      return PolicyNode::leaf(token.text);
    }
    if (token.kind == TokenKind::LParen) {
      ++pos_;
      auto inner = parseExpression();
      if (ok() && peek().kind != TokenKind::RParen) {
        error_ = "missing ')'";
      }
      ++pos_;
      return inner;
    }
    error_ = token.kind == TokenKind::End ? "unexpected end of policy"
                                          : "unexpected '" + token.text + "'";
    return nullptr;
  }

  // (a AND b) AND c is stored as one 3-of-3 gate
  std::vector<std::shared_ptr<const PolicyNode>>
  flatten(std::vector<std::shared_ptr<const PolicyNode>> nodes, bool and_gate) {
    std::vector<std::shared_ptr<const PolicyNode>> out;
    for (auto &node : nodes) {
      if (!node) {
        continue;
      }
      bool same_kind = !node->isLeaf() &&
                       (and_gate ? node->isAnd() : node->threshold == 1 &&
                                                       node->children.size() > 1);
      if (same_kind) {
        out.insert(out.end(), node->children.begin(), node->children.end());
      } else {
        out.push_back(std::move(node));
      }
    }
    return out;
  }

  const Token &peek() const {
    return tokens_[std::min(pos_, tokens_.size() - 1)];
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  std::string error_;
};

} // namespace

std::shared_ptr<const PolicyNode> PolicyNode::leaf(std::string attribute) {
  auto node = std::make_shared<PolicyNode>();
  node->threshold = 1;
  node->attribute = std::move(attribute);
  return node;
}

std::shared_ptr<const PolicyNode>
PolicyNode::gate(int threshold,
                 std::vector<std::shared_ptr<const PolicyNode>> children) {
  auto node = std::make_shared<PolicyNode>();
  node->threshold = threshold;
  node->children = std::move(children);
  return node;
}

Result<AccessPolicy> AccessPolicy::parse(const std::string &expression) {
  auto tokens = tokenize(expression);
  if (!tokens) {
    return Result<AccessPolicy>(tokens.error(), tokens.message());
  }

  PolicyParser parser(tokens.moveValue());
  auto root = parser.parseExpression();
  if (!parser.ok()) {
    return Result<AccessPolicy>(ErrorCode::CryptoInvalidPolicy,
                                "policy '" + expression + "': " + parser.error());
  }
  if (!parser.atEnd()) {
    return Result<AccessPolicy>(ErrorCode::CryptoInvalidPolicy,
                                "policy '" + expression + "': trailing tokens");
  }

  AccessPolicy policy;
  policy.expression_ = expression;
  policy.root_ = std::move(root);
  return policy;
}

bool AccessPolicy::isSatisfiedBy(const std::set<std::string> &attributes) const {
  std::function<bool(const PolicyNode &)> satisfied =
      [&](const PolicyNode &node) -> bool {
    if (node.isLeaf()) {
      return attributes.count(node.attribute) != 0;
    }
    int met = 0;
    for (const auto &child : node.children) {
      if (satisfied(*child) && ++met >= node.threshold) {
        return true;
      }
    }
    return false;
  };
  return root_ && satisfied(*root_);
}

std::vector<std::string> AccessPolicy::leafAttributes() const {
  std::vector<std::string> out;
  std::function<void(const PolicyNode &)> walk = [&](const PolicyNode &node) {
    if (node.isLeaf()) {
      out.push_back(node.attribute);
      return;
    }
    for (const auto &child : node.children) {
      walk(*child);
    }
  };
  if (root_) {
    walk(*root_);
  }
  return out;
}

} // namespace hierfed
