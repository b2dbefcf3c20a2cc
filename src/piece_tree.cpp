#include "piece_tree.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

static constexpr size_t LEAF_MAX_PIECES = 128;

void PieceTree::recalc(Node* n) {
  if (!n) return;
  if (n->is_leaf()) {
    uint64_t b = 0;
    for (const auto& p : n->pieces) b += p.len;
    n->bytes = b;
    n->piece_total = n->pieces.size();
    n->height = 1;
    return;
  }
  n->bytes = bytes_of(n->left.get()) + bytes_of(n->right.get());
  n->piece_total = pieces_of(n->left.get()) + pieces_of(n->right.get());
  n->height = 1 + std::max(node_height(n->left.get()), node_height(n->right.get()));
}

std::unique_ptr<PieceTree::Node> PieceTree::rotate_left(std::unique_ptr<Node> x) {
  auto y = std::move(x->right);
  auto T2 = std::move(y->left);
  y->left = std::move(x);
  y->left->right = std::move(T2);
  recalc(y->left.get());
  recalc(y.get());
  return y;
}

std::unique_ptr<PieceTree::Node> PieceTree::rotate_right(std::unique_ptr<Node> y) {
  auto x = std::move(y->left);
  auto T2 = std::move(x->right);
  x->right = std::move(y);
  x->right->left = std::move(T2);
  recalc(x->right.get());
  recalc(x.get());
  return x;
}

std::unique_ptr<PieceTree::Node> PieceTree::balance(std::unique_ptr<Node> n) {
  if (!n) return n;
  recalc(n.get());
  int bf = balance_factor(n.get());
  if (bf > 1) { // left heavy
    if (balance_factor(n->left.get()) < 0) {
      n->left = rotate_left(std::move(n->left));
    }
    return rotate_right(std::move(n));
  } else if (bf < -1) { // right heavy
    if (balance_factor(n->right.get()) > 0) {
      n->right = rotate_right(std::move(n->right));
    }
    return rotate_left(std::move(n));
  }
  return n;
}

std::unique_ptr<PieceTree::Node> PieceTree::make_leaf(std::vector<Piece>&& pieces) {
  if (pieces.empty()) return nullptr;
  auto n = std::make_unique<Node>();
  n->pieces = std::move(pieces);
  recalc(n.get());
  return n;
}

std::unique_ptr<PieceTree::Node> PieceTree::join(std::unique_ptr<Node> a, std::unique_ptr<Node> b) {
  if (!a) return b;
  if (!b) return a;
  if (a->is_leaf() && b->is_leaf() && a->pieces.size() + b->pieces.size() <= LEAF_MAX_PIECES / 2) {
    for (auto& p : b->pieces) a->pieces.push_back(p);
    recalc(a.get());
    return a;
  }
  if (node_height(a.get()) > node_height(b.get()) + 1) {
    a->right = join(std::move(a->right), std::move(b));
    return balance(std::move(a));
  }
  if (node_height(b.get()) > node_height(a.get()) + 1) {
    b->left = join(std::move(a), std::move(b->left));
    return balance(std::move(b));
  }
  auto p = std::make_unique<Node>();
  p->left = std::move(a);
  p->right = std::move(b);
  recalc(p.get());
  return p;
}

/* join, then fuse the seam pieces when the right one continues the left one */
std::unique_ptr<PieceTree::Node> PieceTree::join_merging(std::unique_ptr<Node> a, std::unique_ptr<Node> b) {
  if (a && b) {
    const Piece& l = last_piece(a.get());
    Piece r = first_piece(b.get());
    if (l.continued_by(r)) {
      extend_last(a.get(), r.len);
      b = split(std::move(b), r.len).second;
    }
  }
  return join(std::move(a), std::move(b));
}

std::pair<std::unique_ptr<PieceTree::Node>, std::unique_ptr<PieceTree::Node>>
PieceTree::split(std::unique_ptr<Node> n, uint64_t k) {
  if (!n) return {nullptr, nullptr};
  if (k == 0) return {nullptr, std::move(n)};
  if (k >= n->bytes) return {std::move(n), nullptr};
  if (n->is_leaf()) {
    std::vector<Piece> left_pieces;
    std::vector<Piece> right_pieces;
    uint64_t acc = 0;
    for (const Piece& p : n->pieces) {
      if (acc + p.len <= k) {
        left_pieces.push_back(p);
      } else if (acc >= k) {
        right_pieces.push_back(p);
      } else {
        uint64_t head = k - acc;
        left_pieces.push_back(Piece{p.source, p.offset, head});
        right_pieces.push_back(Piece{p.source, p.offset + head, p.len - head});
      }
      acc += p.len;
    }
    return {make_leaf(std::move(left_pieces)), make_leaf(std::move(right_pieces))};
  }
  uint64_t left_bytes = bytes_of(n->left.get());
  if (k < left_bytes) {
    auto [a, b] = split(std::move(n->left), k);
    return {std::move(a), join(std::move(b), std::move(n->right))};
  }
  if (k == left_bytes) return {std::move(n->left), std::move(n->right)};
  auto [a, b] = split(std::move(n->right), k - left_bytes);
  return {join(std::move(n->left), std::move(a)), std::move(b)};
}

std::unique_ptr<PieceTree::Node>
PieceTree::build_balanced(const std::vector<Piece>& pieces, size_t l, size_t r) {
  size_t len = r - l;
  if (len == 0) return nullptr;
  if (len <= LEAF_MAX_PIECES) {
    std::vector<Piece> leaf(pieces.begin() + static_cast<std::ptrdiff_t>(l),
                            pieces.begin() + static_cast<std::ptrdiff_t>(r));
    return make_leaf(std::move(leaf));
  }
  size_t mid = l + len / 2;
  auto left = build_balanced(pieces, l, mid);
  auto right = build_balanced(pieces, mid, r);
  return join(std::move(left), std::move(right));
}

const Piece& PieceTree::first_piece(const Node* n) {
  while (!n->is_leaf()) n = n->left.get();
  return n->pieces.front();
}

const Piece& PieceTree::last_piece(const Node* n) {
  while (!n->is_leaf()) n = n->right.get();
  return n->pieces.back();
}

void PieceTree::extend_last(Node* n, uint64_t add) {
  if (n->is_leaf()) {
    n->pieces.back().len += add;
  } else {
    extend_last(n->right.get(), add);
  }
  recalc(n);
}

void PieceTree::assign(const std::vector<Piece>& pieces) {
  std::vector<Piece> clean;
  clean.reserve(pieces.size());
  for (const Piece& p : pieces) {
    if (p.len == 0) continue;
    if (!clean.empty() && clean.back().continued_by(p)) clean.back().len += p.len;
    else clean.push_back(p);
  }
  root_ = build_balanced(clean, 0, clean.size());
}

void PieceTree::insert(uint64_t pos, const Piece& p) {
  if (pos > total_bytes()) {
    throw std::out_of_range("piece insert at " + std::to_string(pos) + " beyond length " + std::to_string(total_bytes()));
  }
  if (p.len == 0) return;
  auto [A, B] = split(std::move(root_), pos);
  auto M = make_leaf(std::vector<Piece>{p});
  root_ = join_merging(join_merging(std::move(A), std::move(M)), std::move(B));
}

void PieceTree::erase(uint64_t pos, uint64_t len) {
  uint64_t total = total_bytes();
  if (pos > total || len > total - pos) {
    throw std::out_of_range("piece erase " + std::to_string(pos) + "+" + std::to_string(len) +
                            " beyond length " + std::to_string(total));
  }
  if (len == 0) return;
  auto [A, B] = split(std::move(root_), pos);
  auto [M, C] = split(std::move(B), len);
  root_ = join_merging(std::move(A), std::move(C));
}

void PieceTree::visit(const Node* n, uint64_t start, uint64_t end, const Visitor& f) {
  if (!n || start >= end) return;
  if (n->is_leaf()) {
    uint64_t off = 0;
    for (const Piece& p : n->pieces) {
      uint64_t ps = off, pe = off + p.len;
      off = pe;
      if (pe <= start) continue;
      if (ps >= end) break;
      uint64_t s = std::max(start, ps);
      uint64_t e = std::min(end, pe);
      f(p, s - ps, e - s);
    }
    return;
  }
  uint64_t lb = bytes_of(n->left.get());
  if (start < lb) visit(n->left.get(), start, std::min(end, lb), f);
  if (end > lb) visit(n->right.get(), std::max(start, lb) - lb, end - lb, f);
}

void PieceTree::for_each_in_range(uint64_t pos, uint64_t len, const Visitor& f) const {
  uint64_t total = total_bytes();
  if (pos > total || len > total - pos) {
    throw std::out_of_range("piece range " + std::to_string(pos) + "+" + std::to_string(len) +
                            " beyond length " + std::to_string(total));
  }
  visit(root_.get(), pos, pos + len, f);
}

std::vector<Piece> PieceTree::pieces() const {
  std::vector<Piece> out;
  out.reserve(piece_count());
  visit(root_.get(), 0, total_bytes(), [&](const Piece& p, uint64_t, uint64_t){ out.push_back(p); });
  return out;
}

bool PieceTree::check_node(const Node* n) {
  if (!n) return true;
  if (n->is_leaf()) {
    if (n->pieces.empty() || n->pieces.size() > LEAF_MAX_PIECES) return false;
    uint64_t b = 0;
    for (const auto& p : n->pieces) { if (p.len == 0) return false; b += p.len; }
    return b == n->bytes && n->piece_total == n->pieces.size() && n->height == 1;
  }
  if (!n->left || !n->right || !n->pieces.empty()) return false;
  if (!check_node(n->left.get()) || !check_node(n->right.get())) return false;
  int bf = balance_factor(n);
  if (bf > 1 || bf < -1) return false;
  return n->bytes == n->left->bytes + n->right->bytes &&
         n->piece_total == n->left->piece_total + n->right->piece_total &&
         n->height == 1 + std::max(n->left->height, n->right->height);
}

bool PieceTree::check_invariants() const { return check_node(root_.get()); }
