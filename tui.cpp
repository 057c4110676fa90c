#include "tui.hpp"

#include "format.hpp"

#include <algorithm>
#include <vector>

namespace {

constexpr std::uint64_t PAGE_BYTES = HEX_VIEW_LINES * HEX_BYTES_PER_LINE;

std::string flags_label(const DiskOptions& options) {
    std::string label;
    label += options.read_only ? "ro" : "rw";
    if (options.record_writes) label += " +writes";
    if (options.record_reads) label += " +reads";
    label += options.discard_is_zero ? " discard=zero" : " discard=passthrough";
    return label;
}

}

bool go_to_offset(std::shared_ptr<AppState> state, const std::string& text) {
    auto offset = parse_size(text);
    if (!offset) {
        state->status = "Invalid offset: " + text;
        return false;
    }
    if (state->capacity > 0 && *offset >= state->capacity) {
        state->status = "Offset past the end of the disk";
        return false;
    }
    state->cursor = *offset - *offset % HEX_BYTES_PER_LINE;
    state->status.clear();
    return true;
}

bool write_at_cursor(std::shared_ptr<AppState> state, const std::string& text) {
    if (text.empty()) {
        return false;
    }

    std::size_t bytes_written{};
    std::error_code ec;
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(text.data());
    if (!state->disk.write(bytes, 0, text.size(), state->cursor, bytes_written, ec)) {
        state->status = "Write failed: " + ec.message();
        return false;
    }
    state->status = "Wrote " + std::to_string(bytes_written) + " bytes at " + std::to_string(state->cursor);
    return true;
}

bool discard_at_cursor(std::shared_ptr<AppState> state, const std::string& text) {
    auto length = parse_size(text);
    if (!length || *length == 0) {
        state->status = "Invalid length: " + text;
        return false;
    }
    std::error_code ec;
    if (!state->disk.discard(state->cursor, *length, ec)) {
        state->status = "Discard failed: " + ec.message();
        return false;
    }
    state->status = "Discarded " + format_size(*length) + " at " + std::to_string(state->cursor);
    return true;
}

bool flush_disk(std::shared_ptr<AppState> state) {
    std::error_code ec;
    if (!state->disk.flush(ec)) {
        state->status = "Flush failed: " + ec.message();
        return false;
    }
    state->status = "Flushed";
    return true;
}

void move_cursor(std::shared_ptr<AppState> state, std::int64_t delta) {
    if (delta < 0) {
        const std::uint64_t back = static_cast<std::uint64_t>(-delta);
        state->cursor = state->cursor > back ? state->cursor - back : 0;
        return;
    }

    const std::uint64_t last_line =
        state->capacity > 0 ? (state->capacity - 1) - (state->capacity - 1) % HEX_BYTES_PER_LINE : 0;
    state->cursor = std::min(state->cursor + static_cast<std::uint64_t>(delta), last_line);
}

ftxui::Element render_hex_view(std::shared_ptr<AppState> state) {
    ftxui::Elements lines;

    const std::uint64_t remaining = state->capacity > state->cursor ? state->capacity - state->cursor : 0;
    const std::size_t length = static_cast<std::size_t>(std::min(PAGE_BYTES, remaining));

    std::vector<std::uint8_t> page(length);
    std::size_t bytes_read{};
    std::error_code ec;
    if (length > 0 && !state->disk.read(page.data(), 0, length, state->cursor, bytes_read, ec)) {
        lines.push_back(ftxui::text("Read failed: " + ec.message()) | ftxui::color(ftxui::Color::Red));
        return ftxui::window(ftxui::text(" Disk ") | ftxui::bold, ftxui::vbox(std::move(lines)));
    }

    for (std::size_t pos = 0; pos < length; pos += HEX_BYTES_PER_LINE) {
        const std::size_t count = std::min(HEX_BYTES_PER_LINE, length - pos);
        const std::uint64_t offset = state->cursor + pos;
        const char marker = overlay_marker(state->disk.known_chunks(), offset, offset + count - 1);

        ftxui::Element e = ftxui::text(std::string(1, marker) + " " + format_hex_line(offset, page.data() + pos, count));
        if (marker == 'M') {
            e = e | ftxui::color(ftxui::Color::Yellow);
        } else if (marker == 'D') {
            e = e | ftxui::dim;
        }
        if (pos == 0) {
            e = e | ftxui::inverted;  // cursor row
        }
        lines.push_back(e);
    }

    return ftxui::window(ftxui::text(" Disk ") | ftxui::bold, ftxui::vbox(std::move(lines)));
}

ftxui::Element render_chunk_list(std::shared_ptr<AppState> state) {
    ftxui::Elements lines;
    for (const auto& chunk : state->disk.known_chunks()) {
        ftxui::Element e = ftxui::text(describe_chunk(chunk));
        if (chunk.intersects(Chunk::discard(state->cursor, PAGE_BYTES))) {
            e = e | ftxui::bold;
        }
        lines.push_back(e);
    }
    if (lines.empty()) {
        lines.push_back(ftxui::text("(no known chunks)") | ftxui::dim);
    }

    return ftxui::window(ftxui::text(" Known chunks ") | ftxui::bold, ftxui::vbox(std::move(lines)) | ftxui::yframe)
        | ftxui::size(ftxui::WIDTH, ftxui::GREATER_THAN, 36);
}

ftxui::Element render_status_bar(std::shared_ptr<AppState> state) {
    return ftxui::hbox({
        ftxui::text(" " + format_size(state->capacity) + " "),
        ftxui::separator(),
        ftxui::text(" " + flags_label(state->disk.options()) + " "),
        ftxui::separator(),
        ftxui::text(" " + state->status) | ftxui::flex,
        ftxui::text("g:goto w:write x:discard f:flush q:quit ") | ftxui::dim,
    }) | ftxui::border;
}

ftxui::Element render_input_popup(std::shared_ptr<AppState> state) {
    std::string title;
    switch (state->prompt) {
    case Prompt::GOTO:
        title = " Go to offset ";
        break;
    case Prompt::WRITE:
        title = " Text to write at cursor ";
        break;
    case Prompt::DISCARD:
        title = " Bytes to discard at cursor ";
        break;
    case Prompt::NONE:
        break;
    }

    return ftxui::window(
        ftxui::text(title) | ftxui::bold,
        ftxui::vbox({
            state->input_box->Render() | ftxui::inverted | ftxui::border,
            ftxui::text("Press Enter to confirm, Esc to cancel") | ftxui::dim,
        })
    ) | ftxui::size(ftxui::WIDTH, ftxui::LESS_THAN, 48)
      | ftxui::center;
}

ftxui::Element render_app(std::shared_ptr<AppState> state) {
    auto body = ftxui::vbox({
        ftxui::hbox({
            render_hex_view(state) | ftxui::flex,
            render_chunk_list(state),
        }) | ftxui::flex,
        render_status_bar(state),
    });

    if (state->prompt != Prompt::NONE) {
        return ftxui::dbox({
            body,
            render_input_popup(state),
        });
    }
    return body;
}

bool handle_event(ftxui::Event e, ftxui::ScreenInteractive& screen, std::shared_ptr<AppState> state) {
    if (state->prompt != Prompt::NONE) {
        if (e == ftxui::Event::Escape) {
            state->prompt = Prompt::NONE;
            state->input.clear();
            return true;
        }

        if (e == ftxui::Event::Return) {
            switch (state->prompt) {
            case Prompt::GOTO:
                go_to_offset(state, state->input);
                break;
            case Prompt::WRITE:
                write_at_cursor(state, state->input);
                break;
            case Prompt::DISCARD:
                discard_at_cursor(state, state->input);
                break;
            case Prompt::NONE:
                break;
            }
            state->prompt = Prompt::NONE;
            state->input.clear();
            return true;
        }
        return state->input_box->OnEvent(e);
    }

    if (e == ftxui::Event::ArrowDown || e == ftxui::Event::Character('j')) {
        move_cursor(state, static_cast<std::int64_t>(HEX_BYTES_PER_LINE));
        return true;
    }

    if (e == ftxui::Event::ArrowUp || e == ftxui::Event::Character('k')) {
        move_cursor(state, -static_cast<std::int64_t>(HEX_BYTES_PER_LINE));
        return true;
    }

    if (e == ftxui::Event::PageDown || e == ftxui::Event::Character('J')) {
        move_cursor(state, static_cast<std::int64_t>(PAGE_BYTES));
        return true;
    }

    if (e == ftxui::Event::PageUp || e == ftxui::Event::Character('K')) {
        move_cursor(state, -static_cast<std::int64_t>(PAGE_BYTES));
        return true;
    }

    if (e == ftxui::Event::Character('g')) {
        state->prompt = Prompt::GOTO;
        state->input.clear();
        return true;
    }

    if (e == ftxui::Event::Character('w')) {
        state->prompt = Prompt::WRITE;
        state->input.clear();
        return true;
    }

    if (e == ftxui::Event::Character('x')) {
        state->prompt = Prompt::DISCARD;
        state->input.clear();
        return true;
    }

    if (e == ftxui::Event::Character('f')) {
        flush_disk(state);
        return true;
    }

    if (e == ftxui::Event::Character('q')) {
        screen.Exit();
        return true;
    }

    return false;
}

void run_tui(Disk& disk, std::uint64_t capacity) {
    auto state = std::make_shared<AppState>(AppState{disk, capacity});

    state->input_box = ftxui::Input(&state->input, "");

    auto screen = ftxui::ScreenInteractive::Fullscreen();

    ftxui::Component renderer = ftxui::Renderer([state] {
        return render_app(state);
    });

    ftxui::Component app = ftxui::CatchEvent(renderer, [&screen, state](ftxui::Event e) {
            return handle_event(e, screen, state);
    });

    screen.Loop(app);
}
