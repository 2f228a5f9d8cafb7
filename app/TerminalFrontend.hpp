// ncurses rendition of the frontend: panels side by side, a status line,
// modal dialogs drawn over the listing, and the AI, diff and search screens.
#pragma once

#include "Frontend.hpp"

#include <curses.h>

#include <map>
#include <string>

namespace opendir {

struct ThemeColors;

class TerminalFrontend : public Frontend {
public:
    TerminalFrontend() = default;
    ~TerminalFrontend() override;

    // Takes over the terminal. False when it cannot be initialized.
    bool start(std::string &err);

    TerminalFrontend(const TerminalFrontend &) = delete;
    TerminalFrontend &operator=(const TerminalFrontend &) = delete;

    void draw(const App &app) override;
    std::optional<Key> pollKey(int timeoutMs) override;
    void suspend() override;
    void resume() override;
    int listRows() const override;

private:
    SCREEN *screen_ = nullptr;
    bool active_ = false;
    std::map<std::string, int> appliedColors_;

    void applyTheme(const ThemeColors &theme);
    void drawPanels(const App &app);
    void drawPanel(const App &app, std::size_t idx, int x, int width);
    void drawStatus(const App &app);
    void drawAi(const App &app);
    void drawDiff(const App &app);
    void drawSearch(const App &app);
    void drawDialog(const App &app);
    void drawProgress(const App &app);
    void drawConflict(const App &app);
    void drawSymlinkWarning(const App &app);
};

} // namespace opendir
