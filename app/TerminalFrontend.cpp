#include "TerminalFrontend.hpp"

#include "App.hpp"
#include "opendir/RemoteUri.hpp"

#include <curses.h>

#include <algorithm>
#include <clocale>
#include <cstdio>
#include <ctime>
#include <cwchar>
#include <vector>

namespace opendir {

namespace {

enum Pair : short {
    kPanel = 1,
    kSelected,
    kDirectory,
    kSymlink,
    kMarked,
    kStatus,
    kError,
    kProgress,
    kHeader,
    kDialog,
    kBorder,
    kDiffAdded,
    kDiffChanged,
    kAiUser,
    kAiAssistant
};

std::wstring widen(const std::string &s) {
    std::wstring out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size();) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        char32_t cp = 0;
        std::size_t len = 1;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            len = 4;
        } else {
            out.push_back(L'?');
            ++i;
            continue;
        }
        if (i + len > s.size()) {
            out.push_back(L'?');
            break;
        }
        for (std::size_t k = 1; k < len; ++k)
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
        out.push_back(static_cast<wchar_t>(cp));
        i += len;
    }
    return out;
}

int charWidth(wchar_t c) {
    if (c == L'\t')
        return 1;
    const int w = ::wcwidth(c);
    return w < 0 ? 1 : w;
}

// Number of characters of text that fit into columns; cols gets the width.
std::size_t fitChars(const std::wstring &text, int columns, int &cols) {
    cols = 0;
    std::size_t n = 0;
    for (; n < text.size(); ++n) {
        const int w = charWidth(text[n]);
        if (cols + w > columns)
            break;
        cols += w;
    }
    return n;
}

// Draws at most width columns; returns the columns used.
int putText(int y, int x, const std::string &text, int width) {
    if (width <= 0)
        return 0;
    std::wstring w = widen(text);
    std::replace(w.begin(), w.end(), L'\t', L' ');
    int cols = 0;
    const std::size_t n = fitChars(w, width, cols);
    if (n > 0)
        mvaddnwstr(y, x, w.c_str(), static_cast<int>(n));
    return cols;
}

// Like putText, then fills the rest of width with blanks.
void putPadded(int y, int x, const std::string &text, int width) {
    const int used = putText(y, x, text, width);
    if (used < width)
        mvhline(y, x + used, ' ', width - used);
}

std::vector<std::string> wrapText(const std::string &text, int width) {
    std::vector<std::string> lines;
    if (width < 1)
        width = 1;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t nl = text.find('\n', start);
        const std::string raw =
            text.substr(start, nl == std::string::npos ? std::string::npos
                                                       : nl - start);
        std::wstring rest = widen(raw);
        do {
            int cols = 0;
            std::size_t n = fitChars(rest, width, cols);
            if (n < rest.size()) {
                const std::size_t space = rest.rfind(L' ', n);
                if (space != std::wstring::npos && space > 0)
                    n = space + 1;
            } else {
                n = rest.size();
            }
            std::string line;
            for (std::size_t k = 0; k < n; ++k)
                appendUtf8(line, static_cast<char32_t>(rest[k]));
            lines.push_back(std::move(line));
            rest.erase(0, n);
        } while (!rest.empty());
        if (nl == std::string::npos)
            break;
        start = nl + 1;
    }
    return lines;
}

std::string humanSize(std::uint64_t bytes) {
    static const char *const units[] = {"B", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0)
        std::snprintf(buf, sizeof buf, "%llu", static_cast<unsigned long long>(bytes));
    else
        std::snprintf(buf, sizeof buf, "%.1f%s", value, units[unit]);
    return buf;
}

std::string formatTime(std::int64_t epoch) {
    if (epoch <= 0)
        return {};
    const std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    if (!localtime_r(&t, &tm))
        return {};
    char buf[32];
    std::strftime(buf, sizeof buf, "%Y-%m-%d %H:%M", &tm);
    return buf;
}

std::string progressBar(double fraction, int width) {
    if (width < 3)
        return {};
    fraction = std::min(1.0, std::max(0.0, fraction));
    const int inner = width - 2;
    const int filled = static_cast<int>(fraction * inner + 0.5);
    return "[" + std::string(filled, '#') + std::string(inner - filled, '.') +
           "]";
}

const char *diffMarker(DiffStatus status) {
    switch (status) {
    case DiffStatus::Same:
        return " ";
    case DiffStatus::Modified:
        return "M";
    case DiffStatus::LeftOnly:
        return "<";
    case DiffStatus::RightOnly:
        return ">";
    case DiffStatus::DirModified:
        return "~";
    }
    return " ";
}

std::size_t listOffset(std::size_t cursor, std::size_t rows) {
    if (rows == 0)
        return cursor;
    return cursor >= rows ? cursor - rows + 1 : 0;
}

// Clears a centered frame and returns its inner origin.
void drawBox(int height, int width, const std::string &title, int &top,
             int &left) {
    height = std::min(height, LINES);
    width = std::min(width, COLS);
    top = std::max(0, (LINES - height) / 2);
    left = std::max(0, (COLS - width) / 2);
    attron(COLOR_PAIR(kDialog));
    for (int r = 0; r < height; ++r)
        mvhline(top + r, left, ' ', width);
    mvhline(top, left, ACS_HLINE, width);
    mvhline(top + height - 1, left, ACS_HLINE, width);
    mvvline(top, left, ACS_VLINE, height);
    mvvline(top, left + width - 1, ACS_VLINE, height);
    mvaddch(top, left, ACS_ULCORNER);
    mvaddch(top, left + width - 1, ACS_URCORNER);
    mvaddch(top + height - 1, left, ACS_LLCORNER);
    mvaddch(top + height - 1, left + width - 1, ACS_LRCORNER);
    attron(A_BOLD);
    putText(top, left + 2, " " + title + " ", width - 4);
    attroff(A_BOLD);
    attroff(COLOR_PAIR(kDialog));
    top += 1;
    left += 2;
}

std::string masked(const std::string &input) {
    return std::string(widen(input).size(), '*');
}

} // namespace

bool TerminalFrontend::start(std::string &err) {
    std::setlocale(LC_ALL, "");
    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
        err = "Cannot initialize the terminal (TERM is unset or unknown)";
        return false;
    }
    set_term(screen_);
    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    if (has_colors()) {
        start_color();
        use_default_colors();
    }
    active_ = true;
    return true;
}

TerminalFrontend::~TerminalFrontend() {
    if (!screen_)
        return;
    if (active_)
        endwin();
    delscreen(screen_);
}

void TerminalFrontend::suspend() {
    if (!active_)
        return;
    def_prog_mode();
    endwin();
    active_ = false;
}

void TerminalFrontend::resume() {
    if (active_ || !screen_)
        return;
    reset_prog_mode();
    refresh();
    active_ = true;
}

int TerminalFrontend::listRows() const {
    // Header, panel footer, status line and key hints.
    return std::max(1, LINES - 4);
}

std::optional<Key> TerminalFrontend::pollKey(int timeoutMs) {
    if (!active_)
        return std::nullopt;
    timeout(timeoutMs);
    wint_t ch = 0;
    const int rc = get_wch(&ch);
    if (rc == ERR)
        return std::nullopt;
    if (rc == KEY_CODE_YES) {
        switch (ch) {
        case KEY_UP:
            return Key::special(Key::Code::Up);
        case KEY_DOWN:
            return Key::special(Key::Code::Down);
        case KEY_LEFT:
            return Key::special(Key::Code::Left);
        case KEY_RIGHT:
            return Key::special(Key::Code::Right);
        case KEY_PPAGE:
            return Key::special(Key::Code::PageUp);
        case KEY_NPAGE:
            return Key::special(Key::Code::PageDown);
        case KEY_HOME:
            return Key::special(Key::Code::Home);
        case KEY_END:
            return Key::special(Key::Code::End);
        case KEY_IC:
            return Key::special(Key::Code::Insert);
        case KEY_DC:
            return Key::special(Key::Code::Delete);
        case KEY_BACKSPACE:
            return Key::special(Key::Code::Backspace);
        case KEY_ENTER:
            return Key::special(Key::Code::Enter);
        default:
            break;
        }
        if (ch >= KEY_F(1) && ch <= KEY_F(12))
            return Key::function(static_cast<int>(ch - KEY_F0));
        return std::nullopt;
    }
    switch (ch) {
    case 27:
        return Key::special(Key::Code::Escape);
    case '\n':
    case '\r':
        return Key::special(Key::Code::Enter);
    case '\t':
        return Key::special(Key::Code::Tab);
    case 127:
    case 8:
        return Key::special(Key::Code::Backspace);
    default:
        break;
    }
    if (ch >= 1 && ch <= 26)
        return Key::character(U'a' + (ch - 1), true);
    if (ch < 0x20)
        return std::nullopt;
    return Key::character(static_cast<char32_t>(ch));
}

void TerminalFrontend::applyTheme(const ThemeColors &theme) {
    if (!has_colors() || theme.colors == appliedColors_)
        return;
    appliedColors_ = theme.colors;
    auto c = [&](const char *key) -> short {
        const int v = theme.color(key);
        return static_cast<short>(v < COLORS ? v : -1);
    };
    const short bg = c("panel_bg");
    init_pair(kPanel, c("panel_fg"), bg);
    init_pair(kSelected, c("panel_fg"), c("selected_bg"));
    init_pair(kDirectory, c("directory_fg"), bg);
    init_pair(kSymlink, c("symlink_fg"), bg);
    init_pair(kMarked, c("marked_fg"), bg);
    init_pair(kStatus, c("status_fg"), bg);
    init_pair(kError, c("error_fg"), bg);
    init_pair(kProgress, c("progress_fg"), c("dialog_bg"));
    init_pair(kHeader, c("header_fg"), bg);
    init_pair(kDialog, c("dialog_fg"), c("dialog_bg"));
    init_pair(kBorder, c("border_fg"), bg);
    init_pair(kDiffAdded, c("diff_added_fg"), bg);
    init_pair(kDiffChanged, c("diff_changed_fg"), bg);
    init_pair(kAiUser, c("ai_user_fg"), bg);
    init_pair(kAiAssistant, c("ai_assistant_fg"), bg);
    bkgd(COLOR_PAIR(kPanel));
}

void TerminalFrontend::draw(const App &app) {
    if (!active_)
        return;
    applyTheme(app.theme());
    erase();
    switch (app.screen()) {
    case Screen::Panels:
        drawPanels(app);
        break;
    case Screen::Ai:
        drawAi(app);
        break;
    case Screen::Diff:
        drawDiff(app);
        break;
    case Screen::SearchResults:
        drawSearch(app);
        break;
    }
    drawStatus(app);

    if (app.progress())
        drawProgress(app);
    else if (app.conflict())
        drawConflict(app);
    else if (app.symlinkWarning())
        drawSymlinkWarning(app);
    else if (app.dialog().open())
        drawDialog(app);
    refresh();
}

void TerminalFrontend::drawPanels(const App &app) {
    const std::size_t count = app.panels().size();
    if (count == 0)
        return;
    const std::size_t fit =
        std::max<std::size_t>(1, static_cast<std::size_t>(COLS / 24));
    const std::size_t visible = std::min(count, fit);
    std::size_t first = 0;
    const std::size_t active = app.activePanelIndex();
    if (count > visible) {
        first = active >= visible / 2 ? active - visible / 2 : 0;
        first = std::min(first, count - visible);
    }
    const int width = COLS / static_cast<int>(visible);
    for (std::size_t i = 0; i < visible; ++i) {
        const int x = static_cast<int>(i) * width;
        const int w = i + 1 == visible ? COLS - x : width;
        drawPanel(app, first + i, x, w);
    }
}

void TerminalFrontend::drawPanel(const App &app, std::size_t idx, int x,
                                 int width) {
    const PanelState &p = app.panels()[idx];
    const bool active = idx == app.activePanelIndex();
    const int rows = listRows();
    const int inner = width - 1;

    std::string title = "[" + std::to_string(idx + 1) + "] ";
    if (const auto &d = p.display())
        title += formatRemoteDisplay(d->user, d->host, d->port, p.path());
    else
        title += p.path();
    attron(COLOR_PAIR(kHeader) | (active ? A_REVERSE | A_BOLD : 0));
    putPadded(0, x, title, inner);
    attroff(COLOR_PAIR(kHeader) | A_REVERSE | A_BOLD);

    const bool showDate = inner >= 50;
    const bool showSize = inner >= 30;
    const int dateCols = showDate ? 17 : 0;
    const int sizeCols = showSize ? 9 : 0;
    const int nameCols = inner - dateCols - sizeCols;

    const auto &entries = p.entries();
    for (int r = 0; r < rows; ++r) {
        const std::size_t i = p.scroll() + static_cast<std::size_t>(r);
        if (i >= entries.size())
            break;
        const FileItem &item = entries[i];
        const bool isMarked = p.marked().count(item.name) > 0;
        int attr = COLOR_PAIR(kPanel);
        if (active && i == p.cursor())
            attr = COLOR_PAIR(kSelected) | A_BOLD;
        else if (isMarked)
            attr = COLOR_PAIR(kMarked) | A_BOLD;
        else if (item.is_dir)
            attr = COLOR_PAIR(kDirectory) | A_BOLD;
        else if (item.is_symlink)
            attr = COLOR_PAIR(kSymlink);
        if (!active && i == p.cursor())
            attr |= A_UNDERLINE;

        std::string name = (isMarked ? "*" : " ") + item.name;
        if (item.is_symlink)
            name += "@";
        else if (item.is_dir && !item.isParentLink())
            name += "/";

        const int y = 1 + r;
        attron(attr);
        putPadded(y, x, name, nameCols);
        if (showSize) {
            std::string size = item.isParentLink() ? "<UP>"
                               : item.is_dir       ? "<DIR>"
                                                   : humanSize(item.size);
            char buf[16];
            std::snprintf(buf, sizeof buf, "%8s ", size.c_str());
            putPadded(y, x + nameCols, buf, sizeCols);
        }
        if (showDate)
            putPadded(y, x + nameCols + sizeCols,
                      item.isParentLink() ? std::string() : formatTime(item.modified),
                      dateCols);
        attroff(attr);
    }

    std::string footer = std::to_string(entries.empty() ? 0 : entries.size() - 1) +
                         " items";
    if (!p.marked().empty())
        footer += ", " + std::to_string(p.marked().size()) + " marked";
    footer += " | ";
    footer += sortFieldName(p.sortField());
    footer += p.sortOrder() == SortOrder::Asc ? " \xe2\x86\x91" : " \xe2\x86\x93";
    if (!p.isRemote() && p.diskTotal() > 0)
        footer += " | " + humanSize(p.diskAvailable()) + " free of " +
                  humanSize(p.diskTotal());
    attron(COLOR_PAIR(kBorder));
    putPadded(LINES - 3, x, footer, inner);
    mvvline(0, x + inner, ACS_VLINE, LINES - 2);
    attroff(COLOR_PAIR(kBorder));
}

void TerminalFrontend::drawStatus(const App &app) {
    const int y = LINES - 2;
    const RemoteSpinner &spinner = app.spinner();
    if (spinner.busy()) {
        char buf[32];
        std::snprintf(buf, sizeof buf, " (%.0fs)  Esc cancel",
                      spinner.elapsedSeconds());
        attron(COLOR_PAIR(kStatus) | A_BOLD);
        putPadded(y, 0,
                  std::string(1, spinner.frame()) + " " + spinner.message() + buf,
                  COLS);
        attroff(COLOR_PAIR(kStatus) | A_BOLD);
    } else {
        std::string text = app.statusMessage();
        const bool isError = text.find("rror") != std::string::npos ||
                             text.find("ailed") != std::string::npos;
        if (const auto &clip = app.clipboard()) {
            const std::string tag =
                "  [" + std::to_string(clip->names.size()) +
                (clip->op == ClipOperation::Cut ? " cut]" : " copied]");
            text = text.empty() ? tag.substr(2) : text + tag;
        }
        attron(COLOR_PAIR(isError ? kError : kStatus));
        putPadded(y, 0, text, COLS);
        attroff(COLOR_PAIR(isError ? kError : kStatus));
    }

    const char *hints = "";
    switch (app.screen()) {
    case Screen::Panels:
        hints = "F2 Ren  F5 Copy  F6 Move  F7 Mkdir  F8 Del  c/x/v Clip  "
                "e/E Enc/Dec  d Diff  / Find  g Goto  . AI  +/- Panel  q Quit";
        break;
    case Screen::Ai:
        hints = "Enter Send  Esc Cancel/Close  PgUp/PgDn Scroll";
        break;
    case Screen::Diff:
        hints = "f Only differences  Esc Back";
        break;
    case Screen::SearchResults:
        hints = "Enter Go to file  Esc Back";
        break;
    }
    attron(COLOR_PAIR(kHeader) | A_REVERSE);
    putPadded(LINES - 1, 0, hints, COLS);
    attroff(COLOR_PAIR(kHeader) | A_REVERSE);
}

void TerminalFrontend::drawAi(const App &app) {
    const AiStreamSink &ai = app.ai();
    std::string title = "AI assistant";
    if (!ai.sessionId().empty())
        title += "  session " + ai.sessionId().substr(0, 8);
    if (ai.isProcessing())
        title += "  thinking...";
    attron(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);
    putPadded(0, 0, title, COLS);
    attroff(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);

    struct Line {
        short pair;
        std::string text;
    };
    std::vector<Line> lines;
    const int width = std::max(10, COLS - 2);
    for (const HistoryItem &item : ai.history()) {
        short pair = kPanel;
        std::string prefix;
        switch (item.tag) {
        case HistoryTag::User:
            pair = kAiUser;
            prefix = "> ";
            break;
        case HistoryTag::Assistant:
            pair = kAiAssistant;
            break;
        case HistoryTag::Error:
            pair = kError;
            prefix = "! ";
            break;
        case HistoryTag::System:
            pair = kStatus;
            break;
        case HistoryTag::ToolUse:
            pair = kDiffChanged;
            prefix = "\xe2\x9a\x99 ";
            break;
        case HistoryTag::ToolResult:
            pair = kBorder;
            prefix = "  ";
            break;
        }
        for (std::string &l : wrapText(prefix + item.content, width))
            lines.push_back({pair, std::move(l)});
        lines.push_back({kPanel, std::string()});
    }

    const int top = 1;
    const int visible = std::max(1, LINES - 5);
    const std::size_t maxScroll =
        lines.size() > static_cast<std::size_t>(visible)
            ? lines.size() - static_cast<std::size_t>(visible)
            : 0;
    const std::size_t offset = ai.resolveScroll(maxScroll);
    for (int r = 0; r < visible; ++r) {
        const std::size_t i = offset + static_cast<std::size_t>(r);
        if (i >= lines.size())
            break;
        attron(COLOR_PAIR(lines[i].pair));
        putText(top + r, 1, lines[i].text, width);
        attroff(COLOR_PAIR(lines[i].pair));
    }

    attron(COLOR_PAIR(kAiUser) | A_BOLD);
    std::string prompt = "> " + app.aiInput() + "_";
    const std::wstring wide = widen(prompt);
    int cols = 0;
    // Keep the tail of long input visible.
    std::size_t skip = 0;
    while (skip < wide.size()) {
        if (fitChars(wide.substr(skip), COLS, cols) == wide.size() - skip)
            break;
        ++skip;
    }
    std::string tail;
    for (std::size_t k = skip; k < wide.size(); ++k)
        appendUtf8(tail, static_cast<char32_t>(wide[k]));
    putPadded(LINES - 3, 0, tail, COLS);
    attroff(COLOR_PAIR(kAiUser) | A_BOLD);
}

void TerminalFrontend::drawDiff(const App &app) {
    const DiffView &view = *app.diffView();
    const DiffReport &report = view.report;
    std::string title = view.title;
    if (report.identical()) {
        title += "  (identical)";
    } else {
        title += "  M:" + std::to_string(report.count(DiffStatus::Modified)) +
                 " <:" + std::to_string(report.count(DiffStatus::LeftOnly)) +
                 " >:" + std::to_string(report.count(DiffStatus::RightOnly));
    }
    if (view.only_differences)
        title += "  [differences only]";
    attron(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);
    putPadded(0, 0, title, COLS);
    attroff(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);

    const auto rows = view.visibleRows();
    const int visible = listRows() + 1;
    const std::size_t offset =
        listOffset(view.cursor, static_cast<std::size_t>(visible));
    const int sizeCols = 22;
    for (int r = 0; r < visible; ++r) {
        const std::size_t i = offset + static_cast<std::size_t>(r);
        if (i >= rows.size())
            break;
        const DiffRow &row = *rows[i];
        int attr = COLOR_PAIR(kPanel);
        if (row.status == DiffStatus::LeftOnly ||
            row.status == DiffStatus::RightOnly)
            attr = COLOR_PAIR(kDiffAdded);
        else if (row.status == DiffStatus::Modified ||
                 row.status == DiffStatus::DirModified)
            attr = COLOR_PAIR(kDiffChanged);
        if (i == view.cursor)
            attr |= A_REVERSE;
        std::string text = std::string(diffMarker(row.status)) + " " +
                           std::string(static_cast<std::size_t>(row.depth) * 2, ' ') +
                           row.name + (row.is_dir ? "/" : "");
        attron(attr);
        putPadded(1 + r, 0, text, COLS - sizeCols);
        std::string sizes;
        if (!row.is_dir) {
            const std::string l = row.status == DiffStatus::RightOnly
                                      ? std::string("-")
                                      : humanSize(row.left_size);
            const std::string rr = row.status == DiffStatus::LeftOnly
                                       ? std::string("-")
                                       : humanSize(row.right_size);
            char buf[32];
            std::snprintf(buf, sizeof buf, "%10s %10s", l.c_str(), rr.c_str());
            sizes = buf;
        }
        putPadded(1 + r, COLS - sizeCols, sizes, sizeCols);
        attroff(attr);
    }
}

void TerminalFrontend::drawSearch(const App &app) {
    const SearchResults &results = *app.searchResults();
    std::string title = "Search \"" + results.pattern + "\" in " + results.root +
                        ": " + std::to_string(results.matches.size()) +
                        " matches";
    if (results.truncated)
        title += " (truncated)";
    attron(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);
    putPadded(0, 0, title, COLS);
    attroff(COLOR_PAIR(kHeader) | A_BOLD | A_REVERSE);

    const int visible = listRows() + 1;
    const std::size_t offset =
        listOffset(results.cursor, static_cast<std::size_t>(visible));
    for (int r = 0; r < visible; ++r) {
        const std::size_t i = offset + static_cast<std::size_t>(r);
        if (i >= results.matches.size())
            break;
        const int attr =
            i == results.cursor ? COLOR_PAIR(kSelected) | A_BOLD : COLOR_PAIR(kPanel);
        attron(attr);
        putPadded(1 + r, 0, results.matches[i], COLS);
        attroff(attr);
    }
}

void TerminalFrontend::drawDialog(const App &app) {
    const Dialog &d = app.dialog();
    const int width = std::min(COLS - 4, 72);
    int top = 0;
    int left = 0;
    const int inner = width - 4;

    if (d.isConfirm()) {
        const int shown = std::min<int>(8, static_cast<int>(d.items.size()));
        const bool more = d.items.size() > static_cast<std::size_t>(shown);
        drawBox(shown + (more ? 5 : 4), width, d.title, top, left);
        attron(COLOR_PAIR(kDialog));
        for (int i = 0; i < shown; ++i)
            putText(top + i, left, d.items[static_cast<std::size_t>(i)], inner);
        if (more)
            putText(top + shown, left,
                    "... and " + std::to_string(d.items.size() - shown) + " more",
                    inner);
        const char *verb = d.kind == Dialog::Kind::ConfirmEncrypt   ? "encrypt"
                           : d.kind == Dialog::Kind::ConfirmDecrypt ? "decrypt"
                                                                    : "delete";
        putText(top + shown + (more ? 2 : 1), left,
                std::string("y/Enter ") + verb + "   n/Esc cancel", inner);
        attroff(COLOR_PAIR(kDialog));
        return;
    }

    if (d.kind == Dialog::Kind::Bookmarks) {
        const int shown = std::min<int>(std::max(1, LINES - 8),
                                        static_cast<int>(d.items.size()));
        drawBox(shown + 4, width, d.title, top, left);
        const std::size_t offset =
            listOffset(d.selected, static_cast<std::size_t>(shown));
        for (int i = 0; i < shown; ++i) {
            const std::size_t idx = offset + static_cast<std::size_t>(i);
            if (idx >= d.items.size())
                break;
            const int attr = idx == d.selected ? COLOR_PAIR(kDialog) | A_REVERSE
                                               : COLOR_PAIR(kDialog);
            attron(attr);
            putPadded(top + i, left, d.items[idx], inner);
            attroff(attr);
        }
        attron(COLOR_PAIR(kDialog));
        putText(top + shown + 1, left, "Enter go   Del remove   Esc close",
                inner);
        attroff(COLOR_PAIR(kDialog));
        return;
    }

    drawBox(5, width, d.title, top, left);
    const std::string shown = d.kind == Dialog::Kind::ConnectPassword
                                  ? masked(d.input)
                                  : d.input;
    attron(COLOR_PAIR(kDialog) | A_UNDERLINE);
    putPadded(top, left, shown + "_", inner);
    attroff(COLOR_PAIR(kDialog) | A_UNDERLINE);
    attron(COLOR_PAIR(kDialog));
    putText(top + 2, left, "Enter confirm   Esc cancel", inner);
    attroff(COLOR_PAIR(kDialog));
}

void TerminalFrontend::drawProgress(const App &app) {
    const ProgressState &p = *app.progress();
    const int width = std::min(COLS - 4, 72);
    const int inner = width - 4;
    std::string title = operationTitle(p.kind());
    if (p.cancelRequested())
        title += " (cancelling)";
    int top = 0;
    int left = 0;
    drawBox(8, width, title, top, left);

    attron(COLOR_PAIR(kDialog));
    putText(top, left, p.preparing() ? p.preparingMessage() : p.currentFile(),
            inner);
    attroff(COLOR_PAIR(kDialog));

    attron(COLOR_PAIR(kProgress) | A_BOLD);
    if (!p.preparing()) {
        putText(top + 1, left, progressBar(p.fileFraction(), inner), inner);
        putText(top + 2, left, progressBar(p.overallFraction(), inner), inner);
    }
    attroff(COLOR_PAIR(kProgress) | A_BOLD);

    std::string counts = std::to_string(p.completedFiles()) + "/" +
                         std::to_string(p.totalFiles()) + " files";
    if (p.totalBytes() > 0)
        counts += "   " + humanSize(p.completedBytes()) + " / " +
                  humanSize(p.totalBytes());
    attron(COLOR_PAIR(kDialog));
    putText(top + 3, left, counts, inner);
    putText(top + 5, left, "Esc cancel", inner);
    attroff(COLOR_PAIR(kDialog));
}

void TerminalFrontend::drawConflict(const App &app) {
    const ConflictState &c = *app.conflict();
    const ConflictItem *item = c.resolver.current();
    if (!item)
        return;
    const int width = std::min(COLS - 4, 72);
    const int inner = width - 4;
    int top = 0;
    int left = 0;
    drawBox(7, width,
            "Already exists (" + std::to_string(c.resolver.index() + 1) + "/" +
                std::to_string(c.resolver.size()) + ")",
            top, left);
    attron(COLOR_PAIR(kDialog));
    attron(A_BOLD);
    putText(top, left, item->display_name, inner);
    attroff(A_BOLD);
    putText(top + 1, left, item->destination, inner);
    putText(top + 3, left,
            "o overwrite  s skip  a overwrite all  n skip all  Esc cancel",
            inner);
    attroff(COLOR_PAIR(kDialog));
}

void TerminalFrontend::drawSymlinkWarning(const App &app) {
    const SymlinkWarning &w = *app.symlinkWarning();
    const int width = std::min(COLS - 4, 90);
    const int inner = width - 4;
    const int shown = std::min<int>(std::max(1, LINES - 10),
                                    static_cast<int>(w.flagged.size()));
    int top = 0;
    int left = 0;
    drawBox(shown + 5, width,
            std::to_string(w.flagged.size()) + " unsafe symlink(s)", top, left);
    attron(COLOR_PAIR(kDialog));
    for (int i = 0; i < shown; ++i) {
        const FlaggedSymlink &f = w.flagged[static_cast<std::size_t>(i)];
        putText(top + i, left,
                f.relative_path + " -> " + f.target + "  (" + f.reason + ")",
                inner);
    }
    if (w.flagged.size() > static_cast<std::size_t>(shown))
        putText(top + shown, left, "...", inner);
    putText(top + shown + 2, left,
            "Enter/e exclude these   i include all   Esc cancel", inner);
    attroff(COLOR_PAIR(kDialog));
}

} // namespace opendir
