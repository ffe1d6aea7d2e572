#include "fake_platform.hpp"
#include "src/common/constants.hpp"
#include "src/minesweeper/leaderboard_view.hpp"
#include "src/minesweeper/widgets.hpp"
#include <gtest/gtest.h>

static InputEvent click_at(Point position)
{
        return make_pointer_event(PointerUp, position, LeftButton);
}

static std::optional<Command> type_text(GuiElement *element,
                                        const std::string &text)
{
        std::optional<Command> last = std::nullopt;
        for (char c : text) {
                std::optional<Command> command =
                    element->handle_event(make_text_event(c));
                if (command.has_value()) {
                        last = command;
                }
        }
        return last;
}

TEST(LabelTest, SetTextKeepsCenter)
{
        Label label("READY TO GO!", Size12, White);
        label.set_position({.x = 100, .y = 10});
        int center = rect_center(&label.get_rect()).x;

        label.set_text("VICTORY!");

        EXPECT_EQ(label.get_text(), "VICTORY!");
        EXPECT_NEAR(rect_center(&label.get_rect()).x, center, 1);
        EXPECT_EQ(label.get_rect().width, text_width("VICTORY!", Size12));
}

TEST(ButtonTest, ClickInsideEmitsCommand)
{
        Button button("RESTART", Size12, White,
                      make_command(CommandType::Restart));
        button.set_position({.x = 50, .y = 50});
        Point center = rect_center(&button.get_rect());

        std::optional<Command> command = button.handle_event(click_at(center));

        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::Restart);
}

TEST(ButtonTest, IgnoresOtherEvents)
{
        Button button("RESTART", Size12, White,
                      make_command(CommandType::Restart));
        button.set_position({.x = 50, .y = 50});
        Point center = rect_center(&button.get_rect());

        EXPECT_FALSE(button.handle_event(click_at({.x = 0, .y = 0})));
        EXPECT_FALSE(
            button.handle_event(make_pointer_event(PointerDown, center)));
        EXPECT_FALSE(button.handle_event(
            make_pointer_event(PointerUp, center, RightButton)));
}

class SelectionGroupTest : public testing::Test
{
      protected:
        SelectionGroup group{"DIFFICULTY", {Easy, Normal, Hard, Custom},
                             Easy,          Size12,
                             White};

        Point item_point(int index)
        {
                int item = line_height(Size12);
                const Rect &rect = group.get_rect();
                return {.x = rect.x + 2,
                        .y = rect.y + line_height(Size12) + item / 2 +
                             3 * item * index / 2 + item / 2};
        }
};

TEST_F(SelectionGroupTest, ClickSelectsOption)
{
        std::optional<Command> command =
            group.handle_event(click_at(item_point(1)));

        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::SelectDifficulty);
        EXPECT_EQ(command->difficulty, Normal);
        EXPECT_EQ(group.get_selected(), Normal);
}

TEST_F(SelectionGroupTest, ClickOnSelectedOptionDoesNothing)
{
        EXPECT_FALSE(group.handle_event(click_at(item_point(0))));
        EXPECT_EQ(group.get_selected(), Easy);
}

TEST_F(SelectionGroupTest, ClickOnTitleDoesNothing)
{
        Point title = {.x = group.get_rect().x + 2, .y = group.get_rect().y};

        EXPECT_FALSE(group.handle_event(click_at(title)));
}

TEST_F(SelectionGroupTest, RenderMarksSelectedOption)
{
        RecordingDisplay display;
        group.set_selected(Custom);

        group.render(&display);

        EXPECT_EQ(group.get_selected(), Custom);
        EXPECT_TRUE(display.has_string("DIFFICULTY"));
        EXPECT_TRUE(display.has_string("CUSTOM"));
        int lines = (int)std::count_if(
            display.calls.begin(), display.calls.end(),
            [](const DrawCall &call) { return call.kind == LineDraw; });
        EXPECT_EQ(lines, 2);
}

class NumberInputTest : public testing::Test
{
      protected:
        NumberInput input{"WIDTH", 10,     GUI_WIDTH, Size12, White,
                          CommandType::SetColumns, true};

        void start_editing()
        {
                Rect value = input.value_rect();
                input.handle_event(click_at(rect_center(&value)));
        }
};

TEST_F(NumberInputTest, ClickOnValueStartsEditing)
{
        start_editing();

        EXPECT_TRUE(input.is_editing());
}

TEST_F(NumberInputTest, TypingAndEnterEmitsCommand)
{
        start_editing();
        input.handle_event(make_key_event(Backspace));
        input.handle_event(make_key_event(Backspace));
        type_text(&input, "2a5");

        EXPECT_EQ(input.get_current_value(), "25");

        std::optional<Command> command =
            input.handle_event(make_key_event(Enter));
        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::SetColumns);
        EXPECT_EQ(command->text, "25");
        EXPECT_FALSE(input.is_editing());
}

TEST_F(NumberInputTest, ValueLengthIsLimited)
{
        start_editing();
        type_text(&input, "4567");

        EXPECT_EQ(input.get_current_value(), "104");
}

TEST_F(NumberInputTest, ClickElsewhereCancelsEdit)
{
        start_editing();
        type_text(&input, "9");

        input.handle_event(click_at({.x = 1000, .y = 1000}));

        EXPECT_FALSE(input.is_editing());
        EXPECT_EQ(input.get_current_value(), "10");
        EXPECT_EQ(input.get_value(), "10");
}

TEST_F(NumberInputTest, InactiveInputIgnoresEverything)
{
        input.set_active_input(false);
        start_editing();
        type_text(&input, "5");

        EXPECT_FALSE(input.is_editing());
        EXPECT_FALSE(input.handle_event(make_key_event(Enter)));
        EXPECT_EQ(input.get_current_value(), "10");
}

TEST_F(NumberInputTest, SetValueReplacesBothValues)
{
        input.set_value(42);

        EXPECT_EQ(input.get_value(), "42");
        EXPECT_EQ(input.get_current_value(), "42");
}

TEST_F(NumberInputTest, RenderShowsTitleAndValue)
{
        RecordingDisplay display;

        input.render(&display);

        EXPECT_TRUE(display.has_string("WIDTH  10"));
}

TEST(NameInputDialogueTest, AcceptsOnlyNameCharacters)
{
        NameInputDialogue dialogue("ENTER YOUR NAME", MAX_NAME_LENGTH, Size12,
                                   White);

        type_text(&dialogue, "ab -_!9");

        EXPECT_EQ(dialogue.get_value(), "ab-_9");
}

TEST(NameInputDialogueTest, LengthIsLimited)
{
        NameInputDialogue dialogue("ENTER YOUR NAME", MAX_NAME_LENGTH, Size12,
                                   White);

        type_text(&dialogue, "abcdefghijk");

        EXPECT_EQ(dialogue.get_value(), "abcdefgh");
}

TEST(NameInputDialogueTest, EnterSubmitsAndEscapeDismisses)
{
        NameInputDialogue dialogue("ENTER YOUR NAME", MAX_NAME_LENGTH, Size12,
                                   White);
        type_text(&dialogue, "bobx");
        dialogue.handle_event(make_key_event(Backspace));

        std::optional<Command> submit =
            dialogue.handle_event(make_key_event(Enter));
        ASSERT_TRUE(submit.has_value());
        EXPECT_EQ(submit->type, CommandType::SubmitName);
        EXPECT_EQ(submit->text, "bob");

        std::optional<Command> dismiss =
            dialogue.handle_event(make_key_event(Escape));
        ASSERT_TRUE(dismiss.has_value());
        EXPECT_EQ(dismiss->type, CommandType::Dismiss);
}

TEST(LeaderboardViewTest, ClickOrEscapeDismisses)
{
        Leaderboard leaderboard;
        LeaderboardView view(&leaderboard, 340, Size12, White);

        std::optional<Command> click = view.handle_event(click_at({.x = 5, .y = 5}));
        std::optional<Command> escape =
            view.handle_event(make_key_event(Escape));

        ASSERT_TRUE(click.has_value());
        EXPECT_EQ(click->type, CommandType::Dismiss);
        ASSERT_TRUE(escape.has_value());
        EXPECT_EQ(escape->type, CommandType::Dismiss);
        EXPECT_FALSE(view.handle_event(make_key_event(Enter)));
        EXPECT_FALSE(view.handle_event(make_text_event('a')));
}

TEST(LeaderboardViewTest, RendersEntriesOfEverySection)
{
        Leaderboard leaderboard;
        leaderboard.record(Easy, {.name = "alice", .time = 12, .timestamp = 0});
        leaderboard.record(Hard, {.name = "bob", .time = 321, .timestamp = 0});
        LeaderboardView view(&leaderboard, 340, Size12, White);
        RecordingDisplay display;

        view.render(&display);

        EXPECT_EQ(view.get_section_width(), 113);
        EXPECT_TRUE(display.has_string("LEADER BOARD"));
        EXPECT_TRUE(display.has_string("EASY"));
        EXPECT_TRUE(display.has_string("NORMAL"));
        EXPECT_TRUE(display.has_string("HARD"));
        EXPECT_TRUE(display.has_string("alice"));
        EXPECT_TRUE(display.has_string("12"));
        EXPECT_TRUE(display.has_string("bob"));
        EXPECT_TRUE(display.has_string("321"));
}
