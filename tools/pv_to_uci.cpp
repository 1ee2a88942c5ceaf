// pv_to_uci.cpp -- Converts a SAN principal variation into the UCI form the
// protocol's "pv" command reads. Input on stdin: a FEN line, then a PV line.
// Output: the UCI line with check markers and evaluation, then "forced 0|1".
#include <chess.hpp>

#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#include "evaluation.h"

namespace {

bool is_checkmate(const chess::Board& board) {
  if (!board.inCheck()) {
    return false;
  }
  chess::Movelist replies;
  chess::movegen::legalmoves(replies, board);
  return replies.empty();
}

}  // namespace

int main() {
  std::string fen;
  if (!std::getline(std::cin, fen)) {
    std::cerr << "missing fen" << std::endl;
    return 1;
  }
  std::string pv;
  if (!std::getline(std::cin, pv)) {
    std::cerr << "missing pv" << std::endl;
    return 1;
  }
  try {
    chess::Board board(fen);

    chess::Movelist root_moves;
    chess::movegen::legalmoves(root_moves, board);
    const bool forced = board.inCheck() && root_moves.size() == 1;

    const motif::PvLine line = motif::parse_pv_line(pv);
    std::ostringstream out;
    for (const motif::PvMove& step : line.moves) {
      const chess::Move move = chess::uci::parseSan(board, step.text);
      if (move == chess::Move::NO_MOVE) {
        std::cerr << "error: no move for '" << step.text << "'" << std::endl;
        return 1;
      }
      if (out.tellp() > 0) {
        out << ' ';
      }
      out << chess::uci::moveToUci(move);
      board.makeMove(move);
      if (is_checkmate(board)) {
        out << '#';
      } else if (board.inCheck()) {
        out << '+';
      }
    }
    if (line.eval) {
      std::ostringstream eval;
      if (line.eval->mate) {
        eval << "Mate in " << line.eval->mate_in;
      } else {
        eval.setf(std::ios::fixed);
        eval.precision(2);
        eval << (line.eval->pawns >= 0.0 ? "+" : "") << line.eval->pawns;
      }
      out << " (" << eval.str() << ')';
    }
    std::cout << out.str() << std::endl;
    std::cout << "forced " << (forced ? 1 : 0) << std::endl;
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
