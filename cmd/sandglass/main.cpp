/**
 * @file main.cpp
 * @brief sandglass entry: initializes ncurses, installs signal handlers, drives the sand engine from the UI loop.
 *
 * The top rows show the pile (braille-packed by default), the last row the legend and session state.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <chrono>
#include <clocale>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include "Category.h"
#include "EngineConfig.h"
#include "Logger.h"
#include "Renderer.h"
#include "SandEngine.h"
#include "SessionFeed.h"
#include "SimulationClock.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

// Forward decl for use in signal handler
static void init_colors();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw UI
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);

    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Nearest of the 8 basic curses colors, for terminals that cannot redefine colors. */
static short basicColorFor(const PaletteColor& c) {
    const bool r = c.r >= 128, g = c.g >= 128, b = c.b >= 128;
    if (r && g && b) return COLOR_WHITE;
    if (r && g) return COLOR_YELLOW;
    if (r && b) return COLOR_MAGENTA;
    if (g && b) return COLOR_CYAN;
    if (r) return COLOR_RED;
    if (g) return COLOR_GREEN;
    if (b) return COLOR_BLUE;
    return COLOR_WHITE;
}

/** @brief Initialize one color pair per palette index: pair i+1 renders palette index i, pair 13 the fallback. */
static void init_colors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    const bool custom = can_change_color() && COLORS >= 16 + kPaletteSize + 1;
    for (int i = 0; i <= kFallbackColorIndex; ++i) {
        PaletteColor c = paletteColor(i);
        short fg = basicColorFor(c);
        if (custom) {
            fg = static_cast<short>(16 + i);
            init_color(fg, static_cast<short>(c.r * 1000 / 255), static_cast<short>(c.g * 1000 / 255),
                       static_cast<short>(c.b * 1000 / 255));
        }
        init_pair(static_cast<short>(i + 1), fg, -1);
    }
}

static short pairForColorIndex(int colorIndex) {
    if (colorIndex < 0 || colorIndex > kFallbackColorIndex || !has_colors()) return 0;
    return static_cast<short>(colorIndex + 1);
}

/** @brief Grid size for a pile panel of @p cols × @p rows terminal cells. */
static void gridSizeFor(int cols, int rows, bool braille, int& gw, int& gh) {
    gw = braille ? cols * Renderer::kDotWidth : cols;
    gh = braille ? rows * Renderer::kDotHeight : rows;
}

static void drawFrame(WINDOW* win, const Frame& frame) {
    for (int y = 0; y < frame.height; ++y) {
        for (int x = 0; x < frame.width; ++x) {
            const FrameCell& fc = frame.at(x, y);
            wchar_t wstr[2] = {static_cast<wchar_t>(fc.glyph), L'\0'};
            cchar_t cc;
            setcchar(&cc, wstr, A_NORMAL, pairForColorIndex(fc.colorIndex), nullptr);
            mvwadd_wch(win, y, x, &cc);
        }
    }
}

static void drawStatusLine(WINDOW* win, const CategoryTable& table, const SandEngine& engine,
                           const SessionFeed& feed, size_t selected) {
    int rows, cols; getmaxyx(win, rows, cols);
    wmove(win, rows - 1, 0);
    wclrtoeol(win);
    const Occupancy occ = engine.occupancy();
    int x = 0;
    auto cats = table.ordered();
    for (size_t i = 0; i < cats.size() && x < cols; ++i) {
        const Category& c = cats[i];
        std::string label = (i < 9 ? std::to_string(i + 1) : std::string("-")) + ":" + c.name + "(" +
                            std::to_string(occ.count(c.id)) + ")";
        if (i == selected) label = "[" + label + "]";
        short pair = pairForColorIndex(c.colorIndex);
        wattron(win, COLOR_PAIR(pair));
        mvwaddnstr(win, rows - 1, x, label.c_str(), cols - x);
        wattroff(win, COLOR_PAIR(pair));
        x += static_cast<int>(label.size()) + 1;
    }
    std::string status = "| ";
    if (feed.active()) {
        const Category* c = table.find(*feed.category());
        status += std::string("REC ") + (c ? c->name : std::string("?")) + " " + std::to_string(feed.sessionSeconds()) + "s";
    } else {
        status += "IDLE";
    }
    status += "  queued:" + std::to_string(engine.spawner().pending());
    status += "  s:session 1-9:select [/]:move g:grains c/C:clear x:delete q:quit";
    if (x < cols) mvwaddnstr(win, rows - 1, x, status.c_str(), cols - x);
}

/** @brief Program entry: sets up terminal UI and categories, runs the tick/render loop, exits cleanly on signals. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "sandglass");
    Logger::info("sandglass starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (sandglass)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (sandglass)"); }
            } else {
                Logger::error("std::terminate (sandglass): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    EngineConfig cfg = loadConfig(argc, argv);
    Logger::info("config: " + describeConfig(cfg));

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    std::setlocale(LC_ALL, "");
    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) {
        Logger::error("terminal too small");
        endwin();
        Logger::shutdown();
        return 1;
    }

    CategoryTable table;
    table.add("work", "focused work");
    table.add("study", "reading and courses");
    table.add("exercise", "");

    int gw, gh;
    gridSizeFor(cols, rows - 1, cfg.braille, gw, gh);
    SandEngine engine(gw, gh, cfg);
    SessionFeed feed(engine, cfg.flushOnStop, static_cast<std::uint64_t>(cfg.spawnMs / 1000));
    SimulationClock clock(std::chrono::milliseconds(cfg.physicsMs), std::chrono::milliseconds(cfg.spawnMs),
                          std::chrono::milliseconds(1000 / cfg.targetFps), cfg.maxCatchUpTicks);
    clock.reset(SimulationClock::Clock::now());
    Logger::info("pile initialized: " + std::to_string(gw) + "x" + std::to_string(gh));

    size_t selected = 1;
    size_t lastOrphans = 0;
    bool dirty = true;
    bool done = false;
    while (!done) {
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            dirty = true;
            g_needs_full_redraw = 0;
        }

        auto due = clock.advance(SimulationClock::Clock::now());
        if (due.pulses > 0) feed.pulse(due.pulses);
        for (int i = 0; i < due.ticks; ++i) {
            engine.tick();
            dirty = true;
        }

        if (dirty && due.render) {
            Frame frame = cfg.braille ? engine.renderBraille(table) : engine.render(table);
            drawFrame(stdscr, frame);
            drawStatusLine(stdscr, table, engine, feed, selected);
            wrefresh(stdscr);
            dirty = false;

            Occupancy occ = engine.occupancy();
            size_t orphans = occ.uncategorized;
            for (const auto& kv : occ.byCategory) if (!table.find(kv.first)) orphans += kv.second;
            if (orphans != lastOrphans) {
                Logger::info("orphaned grains rendered with fallback color: " + std::to_string(orphans));
                lastOrphans = orphans;
            }
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested");
                done = true; break;
            case 's': case 'S': {
                if (feed.active()) {
                    feed.stop();
                } else if (const Category* c = table.at(selected)) {
                    feed.start(c->id);
                }
                dirty = true;
                break; }
            case 'c':
                engine.clear();
                dirty = true;
                break;
            case 'C':
                engine.clearCategory(kNoneCategoryId);
                dirty = true;
                break;
            case 'g': case 'G':
                if (const Category* c = table.at(selected)) engine.addGrains(c->id, 10);
                break;
            case '[':
                if (table.moveUp(selected)) { --selected; dirty = true; }
                break;
            case ']':
                if (table.moveDown(selected)) { ++selected; dirty = true; }
                break;
            case 'x': case 'X':
                if (const Category* c = table.at(selected)) {
                    CategoryId id = c->id;
                    if (feed.active() && *feed.category() == id) feed.stop();
                    if (table.remove(id)) {
                        Logger::info("category removed: id=" + std::to_string(id.value));
                        if (selected >= table.size()) selected = table.size() - 1;
                        dirty = true;
                    }
                }
                break;
            case KEY_RESIZE: {
                getmaxyx(stdscr, rows, cols);
                if (rows >= 2 && cols >= 1) {
                    gridSizeFor(cols, rows - 1, cfg.braille, gw, gh);
                    engine.resize(gw, gh);
                    werase(stdscr);
                    dirty = true;
                }
                break; }
            default:
                if (ch >= '1' && ch <= '9') {
                    size_t idx = static_cast<size_t>(ch - '1');
                    if (idx < table.size()) {
                        selected = idx;
                        if (feed.active()) feed.start(table.at(idx)->id);
                        dirty = true;
                    }
                }
                break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(8));
    }

    feed.stop();
    endwin();
    g_curses_inited = false;
    Logger::info("sandglass terminating after " + std::to_string(engine.tickCount()) + " ticks");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (sandglass)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (sandglass)");
        Logger::shutdown();
        return 2;
    }
}
