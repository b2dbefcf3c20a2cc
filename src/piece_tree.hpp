#pragma once
/*
 * PieceTree
 *
 * Purpose: ordered sequence of pieces (spans of the original file or of the
 *          append-only added buffer) kept in an AVL tree keyed by byte
 *          length, so locate/insert/erase by offset are O(log n).
 * Design: pieces live only in leaves (at most LEAF_MAX_PIECES each);
 *         internal nodes always have two children and cache aggregate
 *         bytes, piece count and height. Edits are split + join.
 * Note: every piece has len > 0; adjacent pieces that continue each other
 *       (same source, contiguous offsets) are merged at edit seams.
 */
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

struct Piece {
  enum class Source : uint8_t { Original, Added };
  Source source = Source::Original;
  uint64_t offset = 0; /* file offset (Original) or added-buffer offset (Added) */
  uint64_t len = 0;

  static Piece original(uint64_t file_offset, uint64_t len) { return Piece{Source::Original, file_offset, len}; }
  static Piece added(uint64_t buffer_offset, uint64_t len) { return Piece{Source::Added, buffer_offset, len}; }
  bool continued_by(const Piece& next) const { return source == next.source && offset + len == next.offset; }
  bool operator==(const Piece& o) const { return source == o.source && offset == o.offset && len == o.len; }
  bool operator!=(const Piece& o) const { return !(*this == o); }
};

class PieceTree {
public:
  /* (piece, bytes skipped at its start, bytes taken) */
  using Visitor = std::function<void(const Piece&, uint64_t, uint64_t)>;

  PieceTree() = default;
  PieceTree(PieceTree&&) noexcept = default;
  PieceTree& operator=(PieceTree&&) noexcept = default;
  PieceTree(const PieceTree&) = delete;
  PieceTree& operator=(const PieceTree&) = delete;

  void assign(const std::vector<Piece>& pieces);
  void clear() { root_.reset(); }

  uint64_t total_bytes() const { return bytes_of(root_.get()); }
  size_t piece_count() const { return pieces_of(root_.get()); }
  int height() const { return node_height(root_.get()); }
  bool empty() const { return !root_; }

  /* pos <= total_bytes(), p.len > 0 */
  void insert(uint64_t pos, const Piece& p);
  /* [pos, pos+len) within total_bytes() */
  void erase(uint64_t pos, uint64_t len);

  void for_each_in_range(uint64_t pos, uint64_t len, const Visitor& f) const;
  std::vector<Piece> pieces() const;
  /* aggregates, AVL balance, leaf bounds and non-empty pieces */
  bool check_invariants() const;

private:
  struct Node {
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
    std::vector<Piece> pieces; /* non-empty only for leaves */
    uint64_t bytes = 0;        /* aggregated bytes */
    size_t piece_total = 0;    /* aggregated piece count */
    int height = 1;            /* AVL height */
    bool is_leaf() const { return !left && !right; }
  };
  std::unique_ptr<Node> root_;

  static uint64_t bytes_of(const Node* n) { return n ? n->bytes : 0; }
  static size_t pieces_of(const Node* n) { return n ? n->piece_total : 0; }
  static int node_height(const Node* n) { return n ? n->height : 0; }
  static int balance_factor(const Node* n) { return n ? (node_height(n->left.get()) - node_height(n->right.get())) : 0; }
  static void recalc(Node* n);
  static std::unique_ptr<Node> rotate_left(std::unique_ptr<Node> x);
  static std::unique_ptr<Node> rotate_right(std::unique_ptr<Node> y);
  static std::unique_ptr<Node> balance(std::unique_ptr<Node> n);

  static std::unique_ptr<Node> make_leaf(std::vector<Piece>&& pieces);
  static std::unique_ptr<Node> join(std::unique_ptr<Node> a, std::unique_ptr<Node> b);
  static std::unique_ptr<Node> join_merging(std::unique_ptr<Node> a, std::unique_ptr<Node> b);
  static std::pair<std::unique_ptr<Node>, std::unique_ptr<Node>> split(std::unique_ptr<Node> n, uint64_t k);
  static std::unique_ptr<Node> build_balanced(const std::vector<Piece>& pieces, size_t l, size_t r);

  static const Piece& first_piece(const Node* n);
  static const Piece& last_piece(const Node* n);
  static void extend_last(Node* n, uint64_t add);
  static void visit(const Node* n, uint64_t start, uint64_t end, const Visitor& f);
  static bool check_node(const Node* n);
};
