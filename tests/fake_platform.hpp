#pragma once
#include "src/common/platform/interface/platform.hpp"
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

typedef enum DrawKind {
        RectangleDraw,
        LineDraw,
        StringDraw,
        SpriteDraw,
} DrawKind;

typedef struct DrawCall {
        DrawKind kind;
        Point start;
        Color color;
        std::string text;
        Sprite sprite;
} DrawCall;

/**
 * Display that remembers what was drawn since the last `clear`, which is what
 * ends up on screen in the current frame.
 */
class RecordingDisplay : public Display
{
      public:
        std::vector<DrawCall> calls;
        int width = 0;
        int height = 0;
        int refresh_count = 0;
        bool setup_result = true;

        bool setup() override { return setup_result; }
        void resize(int width, int height) override
        {
                this->width = width;
                this->height = height;
        }
        void clear(Color color) override { calls.clear(); }
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override
        {
                calls.push_back({.kind = RectangleDraw,
                                 .start = start,
                                 .color = color,
                                 .text = "",
                                 .sprite = TileSprite});
        }
        void draw_line(Point start, Point end, Color color) override
        {
                calls.push_back({.kind = LineDraw,
                                 .start = start,
                                 .color = color,
                                 .text = "",
                                 .sprite = TileSprite});
        }
        void draw_string(Point start, const char *text, FontSize font_size,
                         Color fg_color) override
        {
                calls.push_back({.kind = StringDraw,
                                 .start = start,
                                 .color = fg_color,
                                 .text = text,
                                 .sprite = TileSprite});
        }
        void draw_sprite(Point start, Sprite sprite, int size) override
        {
                calls.push_back({.kind = SpriteDraw,
                                 .start = start,
                                 .color = Black,
                                 .text = "",
                                 .sprite = sprite});
        }
        int get_height() override { return height; }
        int get_width() override { return width; }
        void refresh() override { refresh_count++; }

        bool has_string(const std::string &text) const
        {
                return std::any_of(calls.begin(), calls.end(),
                                   [&text](const DrawCall &call) {
                                           return call.kind == StringDraw &&
                                                  call.text == text;
                                   });
        }

        int count_sprites(Sprite sprite) const
        {
                return (int)std::count_if(
                    calls.begin(), calls.end(), [sprite](const DrawCall &call) {
                            return call.kind == SpriteDraw &&
                                   call.sprite == sprite;
                    });
        }
};

class ScriptedInput : public InputController
{
      public:
        std::deque<InputEvent> events;

        void push(const InputEvent &event) { events.push_back(event); }

        bool poll_for_input(InputEvent *event) override
        {
                if (events.empty()) {
                        return false;
                }
                *event = events.front();
                events.pop_front();
                return true;
        }
        void setup() override {}
};

/**
 * Time only moves when a test advances it or the game loop sleeps.
 */
class ManualClock : public TimeProvider, public DelayProvider
{
      public:
        long long now_ms = 0;
        long long epoch = 1700000000;

        long long millis() override { return now_ms; }
        long long epoch_seconds() override { return epoch; }
        void delay_ms(int ms) override { now_ms += ms; }
};

struct FakePlatform {
        RecordingDisplay display;
        ScriptedInput input;
        std::vector<InputController *> controllers;
        ManualClock clock;
        PersistentStorage storage;
        Platform platform;

        FakePlatform()
            : controllers({&input}),
              platform({.display = &display,
                        .input_controllers = &controllers,
                        .delay_provider = &clock,
                        .time_provider = &clock,
                        .persistent_storage = &storage})
        {
        }

        FakePlatform(const FakePlatform &) = delete;
        FakePlatform &operator=(const FakePlatform &) = delete;
};
