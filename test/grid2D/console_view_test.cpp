#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>

#include "console_view.hpp"
#include "grid.hpp"

class ConsoleViewTest : public ::testing::Test {
 protected:
  std::ostringstream out;
};

TEST_F(ConsoleViewTest, RenderPrintsTitleAndRows) {
  Grid grid(2, 3);
  grid.populate({{0, 1}, {1, 2}});

  ConsoleView view(out);
  view.render(grid.snapshot());

  EXPECT_EQ(out.str(), "Generation 0:\n.o.\n..o\n\n");
}

TEST_F(ConsoleViewTest, RenderUsesCustomGlyphs) {
  Grid grid(1, 4);
  grid.populate({{0, 0}, {0, 3}});

  ConsoleView view(out, '#', ' ');
  view.render(grid.snapshot());

  EXPECT_EQ(out.str(), "Generation 0:\n#  #\n\n");
}

TEST_F(ConsoleViewTest, RenderShowsCurrentGeneration) {
  Grid grid(3, 3);
  grid.populate({{1, 0}, {1, 1}, {1, 2}});
  grid.step();

  ConsoleView view(out);
  view.render(grid.snapshot());

  EXPECT_EQ(out.str(), "Generation 1:\n.o.\n.o.\n.o.\n\n");
}

TEST_F(ConsoleViewTest, AnimateRendersFramesAndStepsBetweenThem) {
  Grid grid(5, 5);
  grid.populate({{2, 1}, {2, 2}, {2, 3}});

  ConsoleView view(out);
  animate(grid, view, 3, std::chrono::milliseconds(0));

  const std::string text = out.str();
  EXPECT_NE(text.find("Generation 0:"), std::string::npos);
  EXPECT_NE(text.find("Generation 1:"), std::string::npos);
  EXPECT_NE(text.find("Generation 2:"), std::string::npos);
  EXPECT_EQ(text.find("Generation 3:"), std::string::npos);
  EXPECT_EQ(grid.getGeneration(), 2u);
}

TEST_F(ConsoleViewTest, AnimateZeroFramesDoesNothing) {
  Grid grid(3, 3);
  grid.populate({{1, 1}});

  ConsoleView view(out);
  animate(grid, view, 0, std::chrono::milliseconds(0));

  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(grid.getGeneration(), 0u);
  EXPECT_EQ(grid.population(), 1u);
}

TEST_F(ConsoleViewTest, AnimateRejectsNegativeFrameCount) {
  Grid grid(3, 3);
  ConsoleView view(out);

  EXPECT_THROW(animate(grid, view, -2, std::chrono::milliseconds(0)), InvalidParameter);
  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(grid.getGeneration(), 0u);
}
