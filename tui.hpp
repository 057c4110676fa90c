#ifndef TUI_H
#define TUI_H

#include "disk.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <cstdint>
#include <memory>
#include <string>

constexpr int HEX_VIEW_LINES = 16;

enum class Prompt {
    NONE,
    GOTO,
    WRITE,
    DISCARD
};

struct AppState {
    Disk& disk;
    std::uint64_t capacity{};
    std::uint64_t cursor{};

    Prompt prompt{Prompt::NONE};
    std::string input;
    ftxui::Component input_box;

    std::string status;
};

bool go_to_offset(std::shared_ptr<AppState> state, const std::string& text);

bool write_at_cursor(std::shared_ptr<AppState> state, const std::string& text);

bool discard_at_cursor(std::shared_ptr<AppState> state, const std::string& text);

bool flush_disk(std::shared_ptr<AppState> state);

void move_cursor(std::shared_ptr<AppState> state, std::int64_t delta);

ftxui::Element render_hex_view(std::shared_ptr<AppState> state);

ftxui::Element render_chunk_list(std::shared_ptr<AppState> state);

ftxui::Element render_status_bar(std::shared_ptr<AppState> state);

ftxui::Element render_input_popup(std::shared_ptr<AppState> state);

ftxui::Element render_app(std::shared_ptr<AppState> state);

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state);

void run_tui(Disk& disk, std::uint64_t capacity);

#endif
