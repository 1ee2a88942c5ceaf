#pragma once
/**
 * @file attacks.h
 * @brief Attack and movement queries over a mailbox board.
 *
 * Every query is a pure function of the board. Piece movement is modelled as
 * a variant over the six movement rules so each query visits all of them
 * exhaustively. Squares outside the board are rejected at the entry of each
 * query; the ray walkers below never see one.
 */

#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "board.h"

namespace motif {

namespace motion {
struct Pawn {
  Color color;
};
struct Knight {};
struct Bishop {};
struct Rook {};
struct Queen {};
struct King {};
}  // namespace motion

using Mover = std::variant<motion::Pawn, motion::Knight, motion::Bishop, motion::Rook,
                           motion::Queen, motion::King>;

std::optional<Mover> mover_for(Piece pc);

struct Direction {
  int dr{0};
  int dc{0};
};

std::span<const Direction> slider_directions(PieceType pt);
// Unit step from `from` towards `to` if both share a rank, file or diagonal.
std::optional<Direction> line_direction(Square from, Square to);

// Whether `piece` standing on `from` attacks `to`. Side to move and pins are ignored.
bool can_attack(const Board& board, Square from, Piece piece, Square to);
bool is_attacked_by(const Board& board, Square sq, Color by);
int count_attackers(const Board& board, Square sq, Color by);
// Pieces of `owner` protecting `sq`; the piece standing on `sq` never counts.
int count_defenders(const Board& board, Square sq, Color owner);
// 0 when there is no attacker or defender.
int lowest_attacker_value(const Board& board, Square sq, Color by);
int lowest_defender_value(const Board& board, Square sq, Color owner);

std::vector<Square> attackers_of(const Board& board, Square sq, Color by);
// Enemy-occupied squares attacked by the piece on `from`.
std::vector<Square> attacked_enemies(const Board& board, Square from);

struct RayHit {
  std::optional<Square> first;
  std::optional<Square> second;
};

// First two occupied squares walking from `from` (exclusive) along `dir`.
RayHit ray_scan(const Board& board, Square from, Direction dir);
// True when `mid` lies strictly between `a` and `b` on a shared line.
bool is_between(Square a, Square b, Square mid);

bool in_check(const Board& board, Color c);
// The piece on `sq` attacks the opposing king.
bool gives_check(const Board& board, Square sq);

// Pseudo-legal movement shape including pawn pushes; target must not hold a friendly piece.
bool can_move_to(const Board& board, Square from, Square to);
// After playing `m` the mover's king is not attacked. Boards without that king pass.
bool leaves_king_safe(const Board& board, const Move& m);

int king_safe_squares(const Board& board, Color c);
// Destinations for the piece on `sq` where it stands unattacked after moving.
int safe_squares_for_piece(const Board& board, Square sq);
// Squares around the king of `c` attacked by the opponent.
int king_zone_pressure(const Board& board, Color c);
// Same count for the ring around `center`, attacked by `by`.
int king_zone_pressure(const Board& board, Square center, Color by);

// Local verification only: enumerates every pseudo-legal reply of `c`.
bool is_checkmated(const Board& board, Color c);
bool has_mate_in_one(const Board& board, Color c);

}  // namespace motif
