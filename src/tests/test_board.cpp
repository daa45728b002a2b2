#include <gtest/gtest.h>
#include "Board.hpp"

// Fill every playable square with FILL, then apply the overrides.
static void fill_board(Board& b, PieceColor fill) {
  for (char c = 'a'; c <= 'g'; ++c)
    for (char r = '1'; r <= '7'; ++r)
      b.place_piece(c, r, fill);
}

TEST(BoardBasics, StartPosition) {
  Board b;
  EXPECT_EQ(b.get('a', '7'), PieceColor::Red);
  EXPECT_EQ(b.get('g', '1'), PieceColor::Red);
  EXPECT_EQ(b.get('a', '1'), PieceColor::Blue);
  EXPECT_EQ(b.get('g', '7'), PieceColor::Blue);
  EXPECT_EQ(b.get('d', '4'), PieceColor::Empty);
  EXPECT_EQ(b.whose_move(), PieceColor::Red);
  EXPECT_EQ(b.num_pieces(PieceColor::Red), 2);
  EXPECT_EQ(b.num_pieces(PieceColor::Blue), 2);
  EXPECT_EQ(b.num_jumps(), 0);
  EXPECT_EQ(b.num_moves(), 0);
  EXPECT_FALSE(b.game_over());
}

TEST(BoardBasics, IndexLayout) {
  EXPECT_EQ(Board::index('a', '1'), 24);
  EXPECT_EQ(Board::index('g', '1'), 30);
  EXPECT_EQ(Board::index('a', '7'), 90);
  EXPECT_EQ(Board::index('g', '7'), 96);
  EXPECT_EQ(Board::col(62), 'f');
  EXPECT_EQ(Board::row(62), '4');
  EXPECT_TRUE(Board::in_bounds(Board::index('d', '4')));
  EXPECT_FALSE(Board::in_bounds(Board::index('a', '1') - 1));
  EXPECT_FALSE(Board::in_bounds(-5));
  EXPECT_FALSE(Board::in_bounds(Board::CELLS));
}

TEST(BoardBasics, BorderIsBlocked) {
  Board b;
  EXPECT_EQ(b.get(0), PieceColor::Blocked);
  EXPECT_EQ(b.get(Board::index('a', '1') - 1), PieceColor::Blocked);
  EXPECT_EQ(b.get(Board::index('g', '7') + Board::EXTENDED_SIDE), PieceColor::Blocked);
}

TEST(BoardMoves, LegalMoveChecks) {
  Board b;
  EXPECT_TRUE(b.legal_move(Move::move('a', '7', 'a', '6')));
  EXPECT_TRUE(b.legal_move(Move::move('a', '7', 'c', '5')));
  // distance 3
  EXPECT_FALSE(b.legal_move(Move::move('a', '7', 'a', '4')));
  // Blue piece while Red is on move
  EXPECT_FALSE(b.legal_move(Move::move('a', '1', 'a', '2')));
  // empty origin
  EXPECT_FALSE(b.legal_move(Move::move('d', '4', 'd', '5')));
  // occupied destination / same square
  EXPECT_FALSE(b.legal_move(Move::move('a', '7', 'a', '7')));
  EXPECT_TRUE(b.legal_move(Move::pass()));
}

TEST(BoardMoves, CloneKeepsOrigin) {
  Board b;
  b.make_move('a', '7', 'a', '6');
  EXPECT_EQ(b.get('a', '7'), PieceColor::Red);
  EXPECT_EQ(b.get('a', '6'), PieceColor::Red);
  EXPECT_EQ(b.num_pieces(PieceColor::Red), 3);
  EXPECT_EQ(b.num_jumps(), 0);
  EXPECT_EQ(b.whose_move(), PieceColor::Blue);
  EXPECT_EQ(b.num_moves(), 1);
  ASSERT_EQ(b.all_moves().size(), 1u);
  EXPECT_EQ(b.all_moves().back(), Move::move('a', '7', 'a', '6'));
}

TEST(BoardMoves, JumpVacatesOrigin) {
  Board b;
  b.make_move('a', '7', 'a', '5');
  EXPECT_EQ(b.get('a', '7'), PieceColor::Empty);
  EXPECT_EQ(b.get('a', '5'), PieceColor::Red);
  EXPECT_EQ(b.num_pieces(PieceColor::Red), 2);
  EXPECT_EQ(b.num_jumps(), 1);

  // a clone resets the consecutive jump counter
  b.make_move('a', '1', 'a', '2');
  EXPECT_EQ(b.num_jumps(), 0);
}

TEST(BoardMoves, CaptureFlipsAdjacentOpponents) {
  Board b;
  b.make_move('g', '1', 'f', '2');
  b.make_move('g', '7', 'f', '6');
  b.make_move('f', '2', 'f', '4');
  EXPECT_EQ(b.num_jumps(), 1);
  b.make_move('f', '6', 'f', '5');

  EXPECT_EQ(b.get('f', '4'), PieceColor::Blue);
  EXPECT_EQ(b.get(62), PieceColor::Blue);
  EXPECT_EQ(b.num_pieces(PieceColor::Red), 2);
  EXPECT_EQ(b.num_pieces(PieceColor::Blue), 5);
  EXPECT_EQ(b.num_jumps(), 0);
  EXPECT_FALSE(b.positions(PieceColor::Red).empty());
  for (int sq : b.positions(PieceColor::Blue)) {
    EXPECT_EQ(b.get(sq), PieceColor::Blue);
  }
}

TEST(BoardMoves, NeighborsWithinOnlyEmpty) {
  Board b;
  auto near = b.neighbors_within(Board::index('a', '7'), 1);
  // a6, b6, b7
  EXPECT_EQ(near.size(), 3u);
  auto far = b.neighbors_within(Board::index('a', '7'), 2);
  EXPECT_EQ(far.size(), 8u);
  for (int sq : far) EXPECT_TRUE(Board::in_bounds(sq));
}

TEST(BoardTerminal, JumpLimitEndsGame) {
  Board b;
  const Move cycle[4] = {
    Move::move('a', '7', 'a', '5'), Move::move('a', '1', 'a', '3'),
    Move::move('a', '5', 'a', '7'), Move::move('a', '3', 'a', '1'),
  };
  for (int i = 0; i < Board::JUMP_LIMIT - 1; ++i) {
    b.make_move(cycle[i % 4]);
    ASSERT_FALSE(b.game_over()) << "after " << (i + 1) << " jumps";
  }
  EXPECT_EQ(b.num_jumps(), 24);
  b.make_move(cycle[0]);
  EXPECT_EQ(b.num_jumps(), 25);
  EXPECT_TRUE(b.game_over());
}

TEST(BoardTerminal, NoPiecesEndsGame) {
  Board b;
  b.place_piece('a', '1', PieceColor::Empty);
  EXPECT_FALSE(b.game_over());
  b.place_piece('g', '7', PieceColor::Empty);
  EXPECT_EQ(b.num_pieces(PieceColor::Blue), 0);
  EXPECT_TRUE(b.game_over());
}

TEST(BoardTerminal, FullBoardEndsGame) {
  Board b;
  fill_board(b, PieceColor::Red);
  b.place_piece('a', '1', PieceColor::Blue);
  EXPECT_FALSE(b.can_move(PieceColor::Red));
  EXPECT_FALSE(b.can_move(PieceColor::Blue));
  EXPECT_TRUE(b.game_over());
}

TEST(BoardPass, PassWhenStuck) {
  Board b;
  fill_board(b, PieceColor::Blue);
  b.place_piece('a', '7', PieceColor::Red);
  b.place_piece('g', '1', PieceColor::Empty);

  ASSERT_EQ(b.whose_move(), PieceColor::Red);
  EXPECT_FALSE(b.can_move(PieceColor::Red));
  EXPECT_TRUE(b.can_move(PieceColor::Blue));
  EXPECT_FALSE(b.game_over());

  b.pass();
  EXPECT_EQ(b.whose_move(), PieceColor::Blue);
  EXPECT_EQ(b.num_moves(), 1);
  EXPECT_TRUE(b.all_moves().empty());

  b.undo();
  EXPECT_EQ(b.whose_move(), PieceColor::Red);
  EXPECT_EQ(b.num_moves(), 0);
}

TEST(BoardBlocks, BlockAndReflections) {
  Board b;
  b.set_block('c', '3');
  EXPECT_EQ(b.get('c', '3'), PieceColor::Blocked);
  EXPECT_EQ(b.get('e', '3'), PieceColor::Blocked);
  EXPECT_EQ(b.get('c', '5'), PieceColor::Blocked);
  EXPECT_EQ(b.get('e', '5'), PieceColor::Blocked);

  b.set_block("d4");
  EXPECT_EQ(b.get('d', '4'), PieceColor::Blocked);

  b.set_block('b', '1');
  EXPECT_EQ(b.get('b', '1'), PieceColor::Blocked);
  EXPECT_EQ(b.get('f', '1'), PieceColor::Blocked);
  EXPECT_EQ(b.get('b', '7'), PieceColor::Blocked);
  EXPECT_EQ(b.get('f', '7'), PieceColor::Blocked);
}

TEST(BoardBlocks, IllegalPlacementThrows) {
  Board b;
  EXPECT_THROW(b.set_block('a', '7'), std::invalid_argument);
  EXPECT_THROW(b.set_block('h', '1'), std::invalid_argument);
  EXPECT_THROW(b.set_block("zz"), std::invalid_argument);
  EXPECT_THROW(b.set_block("c"), std::invalid_argument);
  b.set_block('c', '3');
  EXPECT_THROW(b.set_block('c', '3'), std::invalid_argument);
}

TEST(BoardBlocks, EmptyCornerIsLeftAlone) {
  Board b;
  b.make_move('a', '7', 'a', '5');
  ASSERT_EQ(b.get('a', '7'), PieceColor::Empty);
  EXPECT_NO_THROW(b.set_block('a', '7'));
  EXPECT_EQ(b.get('a', '7'), PieceColor::Empty);
}

TEST(BoardBlocks, ClearRemovesBlocks) {
  Board b;
  b.set_block('c', '3');
  b.make_move('a', '7', 'a', '6');
  b.clear();
  EXPECT_EQ(b, Board());
  EXPECT_EQ(b.num_moves(), 0);
  EXPECT_EQ(b.whose_move(), PieceColor::Red);
}

TEST(BoardDump, StartPositionText) {
  Board b;
  const std::string expected =
    "===\n"
    "  r - - - - - b\n"
    "  - - - - - - -\n"
    "  - - - - - - -\n"
    "  - - - - - - -\n"
    "  - - - - - - -\n"
    "  - - - - - - -\n"
    "  b - - - - - r\n"
    "===";
  EXPECT_EQ(b.to_string(), expected);

  const std::string legend = b.to_string(true);
  EXPECT_NE(legend.find("7 r - - - - - b\n"), std::string::npos);
  EXPECT_NE(legend.find("  a b c d e f g\n"), std::string::npos);
}

TEST(BoardDump, FlatGrid) {
  Board b;
  b.set_block('d', '4');
  auto flat = b.get_flat_grid();
  ASSERT_EQ(flat.size(), 49u);
  EXPECT_EQ(flat[0], 1);   // a7
  EXPECT_EQ(flat[6], 2);   // g7
  EXPECT_EQ(flat[24], 3);  // d4
  EXPECT_EQ(flat[42], 2);  // a1
  EXPECT_EQ(flat[48], 1);  // g1
}

TEST(BoardListeners, NotifiedAndRemovable) {
  Board b;
  int calls = 0;
  int id = b.add_listener([&calls]() { ++calls; });
  b.make_move('a', '7', 'a', '6');
  EXPECT_EQ(calls, 1);
  b.undo();
  EXPECT_EQ(calls, 2);

  Board copy = b.clone();
  copy.make_move('a', '7', 'a', '6');
  EXPECT_EQ(calls, 2);

  b.remove_listener(id);
  b.make_move('a', '7', 'a', '6');
  EXPECT_EQ(calls, 2);
}

TEST(BoardBlocks, ClearKeepsPositionListsInSync) {
  Board b;
  b.make_move('g', '1', 'f', '2');
  b.make_move('g', '7', 'f', '6');
  b.make_move('f', '2', 'f', '4');
  b.make_move('f', '6', 'f', '5');
  b.set_block('c', '3');
  b.clear();

  const Board fresh;
  EXPECT_EQ(b, fresh);
  EXPECT_EQ(b.positions(PieceColor::Red), fresh.positions(PieceColor::Red));
  EXPECT_EQ(b.positions(PieceColor::Blue), fresh.positions(PieceColor::Blue));
  for (int sq : b.positions(PieceColor::Blue)) {
    EXPECT_EQ(b.get(sq), PieceColor::Blue);
  }
}

TEST(BoardBasics, GetRejectsOffBoardSquares) {
  Board b;
  EXPECT_THROW(b.get('h', '1'), std::invalid_argument);
  EXPECT_THROW(b.get('a', '8'), std::invalid_argument);
  EXPECT_THROW(b.get('z', '9'), std::invalid_argument);
  EXPECT_NO_THROW(b.get('g', '7'));
}
