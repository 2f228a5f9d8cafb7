// Orchestrator and app-state tests: progress and spinner slots, panels,
// settings and the paste/conflict/remote flows driven through App.
#include "App.hpp"
#include "CredentialCodec.hpp"
#include "Settings.hpp"
#include "opendir/EncPack.hpp"
#include "opendir/MockSftpClient.hpp"

#include <QCoreApplication>
#include <QFile>

#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace opendir;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos,
              msg + " (got '" + haystack + "')");
    }
};

struct TempDir {
    fs::path root;

    explicit TempDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("opendir-app-" + tag + "-" + std::to_string(now));
        fs::create_directories(root);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

void writeFile(const fs::path &p, const std::string &content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

class ScriptedFrontend : public Frontend {
public:
    std::deque<Key> keys;
    int draws = 0;
    int suspends = 0;

    void draw(const App &) override { ++draws; }
    std::optional<Key> pollKey(int) override {
        if (keys.empty())
            return std::nullopt;
        Key k = keys.front();
        keys.pop_front();
        return k;
    }
    void suspend() override { ++suspends; }
    void resume() override {}
    int listRows() const override { return 20; }
};

// Polls until neither the progress nor the spinner slot is taken.
bool pump(App &app) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        app.pollWorkers();
        if (!app.busy()) {
            app.pollWorkers();
            if (!app.busy())
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

bool focus(PanelState &p, const std::string &name) {
    for (std::size_t i = 0; i < p.entries().size(); ++i) {
        if (p.entries()[i].name == name) {
            p.setCursor(i);
            return true;
        }
    }
    return false;
}

void typeText(App &app, const std::string &text) {
    for (char c : text)
        app.handleKey(Key::character(static_cast<unsigned char>(c)));
}

AppOptions quietOptions() {
    AppOptions o;
    o.write_lastdir = false;
    return o;
}

RemoteProfile aliceProfile() {
    RemoteProfile p;
    p.name = "box";
    p.host = "box.test";
    p.user = "alice";
    p.auth = RemoteAuth::withPassword("pw");
    return p;
}

void test_progress_state(TestContext &t) {
    t.check(summarize(OperationKind::Copy, {7, 0, ""}) == "Copied 7 items.",
            "success summary");
    t.check(summarize(OperationKind::Move, {1, 0, ""}) == "Moved 1 item.",
            "singular summary");
    t.check(summarize(OperationKind::Copy, {4, 3, "a: denied"}) ==
                "Copied 4/7. Error: a: denied",
            "partial summary");

    ProgressSender tx;
    ProgressState st = ProgressState::start(OperationKind::Copy, tx);
    tx.send(ProgressMessage::preparing("Calculating file sizes..."));
    st.poll();
    t.check(st.preparing(), "preparing shown");
    tx.send(ProgressMessage::prepareComplete());
    tx.send(ProgressMessage::totalProgress(1, 4, 50, 200));
    tx.send(ProgressMessage::error("b", "denied"));
    st.poll();
    t.check(!st.preparing() && st.totalFiles() == 4, "totals applied");
    t.check(st.overallFraction() == 0.25, "byte fraction preferred");
    tx.send(ProgressMessage::completed(3, 1));
    st.poll();
    t.check(!st.active(), "inactive after completion");
    const auto result = st.takeResult();
    t.check(result && result->success_count == 3 &&
                result->last_error == "b: denied",
            "final result carries the last error");
    t.check(!st.takeResult(), "result taken once");

    ProgressSender lost;
    ProgressState dropped = ProgressState::start(OperationKind::Upload, lost);
    lost = ProgressSender();
    dropped.poll();
    const auto gone = dropped.takeResult();
    t.check(gone && gone->failure_count == 1 &&
                gone->last_error == "Cancelled or failed",
            "vanished worker becomes a failure");

    ProgressSender ctx;
    ProgressState cancelled = ProgressState::start(OperationKind::Tar, ctx);
    cancelled.cancel();
    t.check(cancelled.cancelRequested() && isCancelled(cancelled.cancelFlag()),
            "cancel sets the shared flag");
}

void test_spinner(TestContext &t) {
    RemoteSpinner spinner;
    t.check(!spinner.busy() && spinner.message().empty(), "idle spinner");
    const bool started = spinner.start("Working", [](const CancelFlag &cancel) {
        while (!isCancelled(cancel))
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return SpinnerResult::localOp(false, "stopped", false);
    });
    t.check(started && spinner.busy(), "spinner started");
    t.check(!spinner.start("Other", [](const CancelFlag &) {
        return SpinnerResult::localOp(true, "", false);
    }),
            "second task dropped while busy");
    spinner.cancel();

    std::optional<SpinnerResult> r;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!r && std::chrono::steady_clock::now() < deadline) {
        r = spinner.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    t.check(r && r->message == "stopped", "cancelled task answered");
    t.check(!spinner.busy(), "slot freed");
}

void test_panel_state(TestContext &t) {
    TempDir tmp("panel");
    writeFile(tmp.root / "b.txt", "bb");
    writeFile(tmp.root / "A.md", "a");
    writeFile(tmp.root / "big.bin", std::string(100, 'x'));
    fs::create_directories(tmp.root / "zdir");

    PanelState p(tmp.root.string());
    t.check(p.path() == tmp.root.string(), "panel opens the start path");
    const auto &e = p.entries();
    t.check(e.size() == 5 && e[0].isParentLink() && e[1].name == "zdir",
            "parent link, then directories");
    t.check(e[2].name == "A.md" && e[3].name == "b.txt",
            "names sorted case-insensitively");

    p.setSort(SortField::Size, SortOrder::Desc);
    t.check(p.entries()[1].name == "zdir" && p.entries()[2].name == "big.bin",
            "size sort keeps directories first");

    p.setCursor(0);
    t.check(p.selectedNames().empty(), "parent link never selected");
    p.markAll();
    t.check(p.marked().size() == 4, "mark all skips the parent link");
    t.check(p.selectedNames().front() == "zdir", "selection in listing order");
    p.clearMarks();

    PanelState missing((tmp.root / "nope" / "deeper").string());
    t.check(missing.path() == tmp.root.string(),
            "missing start falls back to the nearest directory");

    std::string err;
    t.check(p.navigate((tmp.root / "zdir").string(), err), "navigate: " + err);
    const auto parent = p.parentForNavigation();
    t.check(parent && *parent == tmp.root.string(), "parent path");
    t.check(p.navigate(*parent, err) && p.current() &&
                p.current()->name == "zdir",
            "focus returns to the directory we came from");
    t.check(!p.navigate((tmp.root / "b.txt").string(), err) &&
                p.path() == tmp.root.string(),
            "failed navigation keeps the path");
}

void test_cursor_after_entering(TestContext &t) {
    TempDir tmp("enter");
    fs::create_directories(tmp.root / "a" / "logs" / "aaa");
    fs::create_directories(tmp.root / "a" / "logs" / "logs");
    fs::create_directories(tmp.root / "a" / "other");

    PanelState p((tmp.root / "a").string());
    std::size_t logsRow = 0;
    for (std::size_t i = 0; i < p.entries().size(); ++i) {
        if (p.entries()[i].name == "logs")
            logsRow = i;
    }
    p.setCursor(logsRow);
    t.check(p.current() && p.current()->name == "logs", "cursor on logs");

    std::string err;
    t.check(p.navigate((tmp.root / "a" / "logs").string(), err),
            "enter logs: " + err);
    t.check(p.cursor() == 0,
            "entering a directory starts at the top, got row " +
                std::to_string(p.cursor()));

    p.setCursor(2);
    std::string reloadErr;
    t.check(p.loadFiles(reloadErr) && p.current() &&
                p.current()->name == "logs",
            "reloading the same directory keeps the cursor name");

    const auto parent = p.parentForNavigation();
    t.check(parent.has_value() && p.pendingFocus(), "parent focus pending");
    t.check(!p.navigate((tmp.root / "missing").string(), err),
            "navigation into a missing directory fails");
    t.check(!p.pendingFocus(), "failed navigation drops the pending focus");
    t.check(p.navigate((tmp.root / "a").string(), err) && p.cursor() == 0,
            "stale focus not applied to a later listing");
}

void test_settings_roundtrip(TestContext &t) {
    TempDir tmp("settings");
    const QString path =
        QString::fromStdString((tmp.root / "cfg" / "settings.json").string());

    Settings loaded;
    QString err;
    t.check(loadSettings(path, loaded, err), "missing file yields defaults");
    t.check(loaded == Settings::defaults() && loaded.panels.size() == 2,
            "defaults have two panels");

    Settings s = Settings::defaults();
    s.theme_name = "matrix";
    s.tar_path = "/usr/bin/tar";
    s.bookmarked_path = {"/srv", "alice@box.test:/var"};
    s.diff_compare_method = CompareMethod::ContentAndTime;
    s.panels[1].start_path = "/tmp";
    s.panels[1].sort_by = SortField::Modified;
    s.panels[1].sort_order = SortOrder::Desc;
    s.active_panel_index = 1;
    RemoteProfile key = aliceProfile();
    key.auth = RemoteAuth::withKeyFile("~/.ssh/id_ed25519",
                                       std::string("phrase"));
    key.default_path = "/var/www";
    s.upsertProfile(key);
    RemoteProfile pw = aliceProfile();
    pw.host = "other.test";
    pw.port = 2222;
    s.upsertProfile(pw);

    t.check(saveSettings(path, s, err),
            "save: " + err.toStdString());
    struct stat st {};
    t.check(::stat(path.toStdString().c_str(), &st) == 0 &&
                (st.st_mode & 0777) == 0600,
            "settings file is private");
    const std::string raw = readFile(path.toStdString());
    t.check(raw.find("\"pw\"") == std::string::npos &&
                raw.find("phrase") == std::string::npos,
            "secrets are not stored in plain text");

    Settings back;
    t.check(loadSettings(path, back, err) && back == s,
            "settings survive a save/load cycle");
    const RemoteProfile *found = back.findProfile("alice", "other.test", 2222);
    t.check(found && found->auth.password == "pw", "password restored");

    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly | QIODevice::Truncate), "open raw");
    f.write("{\"panels\":[{\"sort_by\":\"colour\"}],\"active_panel_index\":9,"
            "\"diff_compare_method\":\"bogus\",\"unknown\":1}");
    f.close();
    t.check(loadSettings(path, back, err), "lenient load");
    t.check(back.panels.size() == 1 &&
                back.panels[0].sort_by == SortField::Name &&
                back.active_panel_index == 0 &&
                back.diff_compare_method == CompareMethod::Content,
            "invalid values fall back to defaults");

    t.check(f.open(QIODevice::WriteOnly | QIODevice::Truncate), "open raw");
    f.write("{ not json");
    f.close();
    err.clear();
    t.check(!loadSettings(path, back, err) && !err.isEmpty(),
            "malformed file is an error");
}

void test_credential_codec(TestContext &t) {
    const QString stored = obfuscate(QStringLiteral("s3cr3t-ü"));
    t.check(stored.startsWith(QLatin1String(kObfuscatedPrefix)),
            "prefixed output");
    t.check(!stored.contains(QLatin1String("s3cr3t")), "not plain text");
    t.check(deobfuscate(stored) == QStringLiteral("s3cr3t-ü"), "reversible");

    // Values written by earlier releases of the settings file.
    t.check(stored == QStringLiteral("enc:EFwIE1AQRLHj"),
            "encoding matches existing settings files");
    t.check(deobfuscate(QStringLiteral("enc:CxoFFQYWWw==")) ==
                QStringLiteral("hunter2"),
            "existing ciphertext decodes");

    t.check(deobfuscate(QStringLiteral("legacy")) == QStringLiteral("legacy"),
            "unprefixed values pass through");
    t.check(deobfuscate(QStringLiteral("enc:%%%")) == QStringLiteral("enc:%%%"),
            "malformed base64 kept as stored");
    t.check(deobfuscate(QStringLiteral("enc:nA==")) == QStringLiteral("enc:nA=="),
            "invalid UTF-8 kept as stored");

    TempDir tmp("codec");
    const QString path =
        QString::fromStdString((tmp.root / "settings.json").string());
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly), "write hand-edited settings");
    f.write(R"({"remote_profiles":[{"name":"box","host":"box.test","port":22,)"
            R"("user":"alice","auth":{"type":"password","password":"enc:%%%"},)"
            R"("default_path":"/home/alice"}]})");
    f.close();
    Settings s;
    QString err;
    t.check(loadSettings(path, s, err), "settings with a bad credential load: " +
                                            err.toStdString());
    t.check(s.remote_profiles.size() == 1 &&
                s.remote_profiles[0].auth.password == "enc:%%%",
            "profile kept with the stored value");
}

struct LocalPair {
    TempDir tmp{"pair"};
    fs::path left = tmp.root / "left";
    fs::path right = tmp.root / "right";

    LocalPair() {
        fs::create_directories(left);
        fs::create_directories(right);
    }
};

void test_copy_with_conflict(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "a.txt", "new a");
    writeFile(dirs.left / "b.txt", "new b");
    writeFile(dirs.right / "a.txt", "old a");

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    app.panel(0).markAll();
    app.transferToNextPanel(ClipOperation::Copy);
    t.check(app.conflict().has_value() &&
                app.conflict()->resolver.size() == 1,
            "one conflict detected");
    t.check(!app.progress(), "nothing runs before the conflict is resolved");

    app.handleKey(Key::character('s'));
    t.check(!app.conflict(), "conflict walk finished");
    t.check(pump(app), "copy finished");
    t.check(readFile(dirs.right / "a.txt") == "old a", "skipped file kept");
    t.check(readFile(dirs.right / "b.txt") == "new b", "other file copied");
    t.check(app.lastSummary() &&
                app.lastSummary()->rfind("Copied", 0) == 0,
            "summary reported");
    t.check(focus(app.panel(1), "b.txt"), "target panel refreshed");

    app.panel(0).markAll();
    app.transferToNextPanel(ClipOperation::Copy);
    app.handleKey(Key::character('a'));
    t.check(pump(app), "overwrite finished");
    t.check(readFile(dirs.right / "a.txt") == "new a", "overwrite all applied");

    app.panel(0).markAll();
    app.transferToNextPanel(ClipOperation::Cut);
    t.check(app.conflict().has_value(), "move conflicts detected");
    app.handleKey(Key::special(Key::Code::Escape));
    t.check(!app.conflict() && fs::exists(dirs.left / "a.txt"),
            "cancelled conflict leaves everything in place");
}

void test_encrypt_directory(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "notes.txt", "private notes");
    writeFile(dirs.left / "photo.raw", std::string(3000, 'p'));

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    app.handleKey(Key::character('e'));
    t.check(app.dialog().kind == Dialog::Kind::ConfirmEncrypt &&
                app.dialog().items.size() == 2,
            "encrypt asks first and lists both files");
    app.handleKey(Key::character('n'));
    t.check(fs::exists(dirs.left / "notes.txt"), "declined encrypt is a no-op");

    app.handleKey(Key::character('e'));
    app.handleKey(Key::character('y'));
    t.check(pump(app), "encrypt finished");
    t.check(!fs::exists(dirs.left / "notes.txt") &&
                !fs::exists(dirs.left / "photo.raw"),
            "originals replaced by chunks");
    t.check(fs::exists(encKeyPath()), "key created on first encrypt");
    t.check(app.lastSummary() &&
                app.lastSummary()->rfind("Encrypted 2", 0) == 0,
            "encrypt summary reported");

    app.handleKey(Key::character('E'));
    t.check(app.dialog().kind == Dialog::Kind::ConfirmDecrypt,
            "decrypt asks first");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(pump(app), "decrypt finished");
    t.check(readFile(dirs.left / "notes.txt") == "private notes" &&
                readFile(dirs.left / "photo.raw") == std::string(3000, 'p'),
            "files restored");
    t.check(focus(app.panel(0), "notes.txt"), "panel refreshed after decrypt");

    app.handleKey(Key::character('E'));
    t.check(app.dialog().kind == Dialog::Kind::None &&
                app.statusMessage() == "No encrypted files here",
            "nothing to decrypt");
}

void test_cut_and_paste(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "report.txt", "r");

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    t.check(focus(app.panel(0), "report.txt"), "file listed");
    app.handleKey(Key::character('x'));
    t.check(app.clipboard() && app.clipboard()->op == ClipOperation::Cut,
            "cut to clipboard");
    t.checkContains(app.statusMessage(), "1 item cut", "cut status");

    app.handleKey(Key::character('v'));
    t.check(app.statusMessage() == "Cannot move items into the same folder",
            "move into the same folder refused");

    app.handleKey(Key::special(Key::Code::Tab));
    t.check(app.activePanelIndex() == 1, "tab switches panel");
    app.handleKey(Key::character('v'));
    t.check(!app.clipboard(), "cut clipboard consumed by paste");
    t.check(pump(app), "move finished");
    t.check(fs::exists(dirs.right / "report.txt") &&
                !fs::exists(dirs.left / "report.txt"),
            "file moved");
    t.check(!focus(app.panel(0), "report.txt"), "source panel refreshed");

    t.check(focus(app.panel(1), "report.txt"), "moved file listed");
    app.handleKey(Key::character('c'));
    app.handleKey(Key::character('v'));
    t.check(pump(app), "duplicate finished");
    t.check(fs::exists(dirs.right / "report_dup.txt") &&
                fs::exists(dirs.right / "report.txt"),
            "copy into the same folder duplicates");
    t.check(app.lastSummary() &&
                app.lastSummary()->rfind("Duplicated", 0) == 0,
            "duplicate summary");
}

void test_symlink_exclusion(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.tmp.root / "outside" / "secret", "s");
    fs::create_symlink(dirs.tmp.root / "outside" / "secret",
                       dirs.left / "link");

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    t.check(focus(app.panel(0), "link"), "link listed");
    app.transferToNextPanel(ClipOperation::Copy);
    t.check(app.symlinkWarning() && app.symlinkWarning()->flagged.size() == 1,
            "outside link flagged");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(!app.symlinkWarning() && !app.progress(),
            "nothing left to copy once the link is excluded");
    t.checkContains(app.statusMessage(), "Nothing left to copy",
                    "exclusion status");

    app.transferToNextPanel(ClipOperation::Copy);
    app.handleKey(Key::character('i'));
    t.check(pump(app), "include-all copy finished");
    t.check(fs::is_symlink(dirs.right / "link"), "link copied as a link");
}

void test_dialogs(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "old.txt", "o");

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());

    app.handleKey(Key::character('k'));
    t.check(app.dialog().kind == Dialog::Kind::Mkdir, "mkdir dialog");
    typeText(app, "fresh");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(fs::is_directory(dirs.left / "fresh"), "directory created");
    t.check(app.activePanel().current() &&
                app.activePanel().current()->name == "fresh",
            "cursor on the new directory");

    app.handleKey(Key::character('m'));
    typeText(app, "bad/name");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(!fs::exists(dirs.left / "bad"), "invalid name rejected");
    t.check(!app.statusMessage().empty(), "validation message shown");

    t.check(focus(app.panel(0), "old.txt"), "old.txt listed");
    app.handleKey(Key::character('r'));
    t.check(app.dialog().input == "old.txt", "rename prefilled");
    app.handleKey(Key::special(Key::Code::Backspace));
    app.handleKey(Key::special(Key::Code::Backspace));
    app.handleKey(Key::special(Key::Code::Backspace));
    typeText(app, "md");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(fs::exists(dirs.left / "old.md") && !fs::exists(dirs.left / "old.txt"),
            "renamed");

    t.check(focus(app.panel(0), "old.md"), "renamed entry listed");
    app.handleKey(Key::special(Key::Code::Delete));
    t.check(app.dialog().kind == Dialog::Kind::ConfirmDelete &&
                app.dialog().items.size() == 1,
            "delete asks first");
    app.handleKey(Key::character('n'));
    t.check(fs::exists(dirs.left / "old.md"), "declined delete keeps the file");
    app.handleKey(Key::special(Key::Code::Delete));
    app.handleKey(Key::character('y'));
    t.check(!fs::exists(dirs.left / "old.md"), "confirmed delete");

    app.handleKey(Key::character('b'));
    t.check(app.settings().bookmarked_path.size() == 1 &&
                app.settings().bookmarked_path[0] == dirs.left.string(),
            "bookmark added");
    app.handleKey(Key::character('B'));
    t.check(app.dialog().kind == Dialog::Kind::Bookmarks, "bookmark list");
    app.handleKey(Key::special(Key::Code::Escape));
    app.handleKey(Key::character('b'));
    t.check(app.settings().bookmarked_path.empty(), "bookmark toggled off");

    app.handleKey(Key::character('g'));
    typeText(app, dirs.right.string());
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(app.activePanel().path() == dirs.right.string(), "goto directory");

    app.goTo("bob@example.test:2200:/srv");
    t.check(app.dialog().kind == Dialog::Kind::ConnectPassword,
            "unknown host asks for a password");
    t.checkContains(app.dialog().title, "bob@example.test",
                    "password prompt names the host");
    app.handleKey(Key::special(Key::Code::Escape));
    t.check(!app.dialog().open(), "prompt dismissed");
}

void test_quit_waits_for_copy(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "large.bin", std::string(24 * 1024 * 1024, 'q'));

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    app.panel(0).markAll();
    app.transferToNextPanel(ClipOperation::Copy);
    t.check(app.busy(), "copy running");
    app.quit();
    t.check(!app.running(), "quit requested");

    // The worker has returned: the target is either complete or removed.
    std::error_code ec;
    const fs::path out = dirs.right / "large.bin";
    const bool present = fs::exists(out, ec);
    t.check(!present || fs::file_size(out, ec) == 24u * 1024 * 1024,
            "no partial copy left after quit");
}

void test_panels_and_quit(TestContext &t) {
    LocalPair dirs;
    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string()}, &fe, nullptr, nullptr,
            quietOptions());
    t.check(app.panels().size() == 1, "one start path, one panel");
    app.handleKey(Key::character('-'));
    t.check(app.panels().size() == 1 &&
                app.statusMessage() == "Cannot close the last panel",
            "last panel stays");
    for (int i = 0; i < 12; ++i)
        app.handleKey(Key::character('+'));
    t.check(app.panels().size() == kMaxPanels, "panel count capped");
    app.handleKey(Key::character('-'));
    t.check(app.panels().size() == kMaxPanels - 1, "panel closed");

    app.handleKey(Key::character('.'));
    t.check(app.screen() == Screen::Ai, "AI pane opened");
    t.check(app.ai().history().size() == 2 &&
                app.ai().history()[1].tag == HistoryTag::Error,
            "warning and missing-provider notice");
    app.handleKey(Key::special(Key::Code::Escape));
    t.check(app.screen() == Screen::Panels, "AI pane closed");

    fe.keys.push_back(Key::character('q'));
    t.check(!app.tick(), "q quits");
    t.check(!app.running() && fe.draws == 1, "drawn once before quitting");
}

void test_diff_and_search(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "same.txt", "s");
    writeFile(dirs.right / "same.txt", "s");
    writeFile(dirs.left / "sub" / "notes.txt", "l");
    writeFile(dirs.right / "sub" / "notes.txt", "r");

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, nullptr, nullptr, quietOptions());
    app.handleKey(Key::character('d'));
    t.check(pump(app), "diff finished");
    t.check(app.screen() == Screen::Diff && app.diffView(),
            "diff screen shown");
    t.check(app.diffView()->report.count(DiffStatus::Modified) == 1,
            "one modified file");
    app.handleKey(Key::character('f'));
    t.check(app.diffView()->visibleRows().size() == 2,
            "only differences: sub and sub/notes.txt");
    app.handleKey(Key::character('q'));
    t.check(app.screen() == Screen::Panels && !app.diffView(),
            "diff closed");

    app.startSearch("NOTES*");
    t.check(pump(app), "search finished");
    t.check(app.screen() == Screen::SearchResults && app.searchResults() &&
                app.searchResults()->matches.size() == 1,
            "wildcard search finds the nested file");
    app.handleKey(Key::special(Key::Code::Enter));
    t.check(app.activePanel().path() == (dirs.left / "sub").string() &&
                app.activePanel().current()->name == "notes.txt",
            "jump to the match");

    app.startSearch("zzz");
    t.check(pump(app), "empty search finished");
    t.checkContains(app.statusMessage(), "No matches", "no-match status");
}

void test_remote_flow(TestContext &t) {
    LocalPair dirs;
    writeFile(dirs.left / "upload.txt", "payload");

    MockSftpClient server;
    server.setFileContent("/home/alice/existing.txt", "e");
    SftpClientFactory factory = [&server]() -> std::unique_ptr<SftpClient> {
        return server.sibling();
    };

    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, factory, nullptr, quietOptions());
    app.connectProfile(aliceProfile(), 1);
    t.check(pump(app), "connect finished");
    PanelState &remote = app.panel(1);
    t.check(remote.isRemote() && remote.path() == "/home/alice",
            "panel attached at the login directory");
    t.check(focus(remote, "existing.txt"), "remote listing shown");
    t.check(app.settings().remote_profiles.size() == 1,
            "new profile remembered");

    t.check(focus(app.panel(0), "upload.txt"), "local file listed");
    app.transferToNextPanel(ClipOperation::Copy);
    t.check(app.progress() &&
                app.progress()->kind() == OperationKind::Upload,
            "upload strategy chosen");
    t.check(pump(app), "upload finished");
    std::string content;
    t.check(server.fileContent("/home/alice/upload.txt", content) &&
                content == "payload",
            "file uploaded");
    t.check(focus(app.panel(1), "upload.txt"), "remote panel refreshed");

    app.setActivePanel(1);
    app.createDirectory("made");
    t.check(pump(app), "remote mkdir finished");
    t.check(server.hasPath("/home/alice/made"), "remote directory created");
    t.check(app.activePanel().current() &&
                app.activePanel().current()->name == "made",
            "focus on the new remote directory");

    app.openCurrent();
    t.check(pump(app), "remote listing finished");
    t.check(app.activePanel().path() == "/home/alice/made", "entered directory");
    app.goParent();
    t.check(pump(app), "parent listing finished");
    t.check(app.activePanel().current() &&
                app.activePanel().current()->name == "made",
            "focus back on the child");

    app.goTo("/nowhere");
    t.check(pump(app), "goto finished");
    t.checkContains(app.statusMessage(), "Directory not found",
                    "missing remote directory reported");

    app.disconnectPanel(1);
    t.check(!app.panel(1).isRemote(), "panel back to local");
    app.disconnectPanel(1);
    t.check(app.statusMessage() == "Not a remote panel",
            "second disconnect refused");
}

void test_remote_connect_failure(TestContext &t) {
    LocalPair dirs;
    MockSftpClient server;
    server.setFailConnect(true);
    SftpClientFactory factory = [&server]() -> std::unique_ptr<SftpClient> {
        return server.sibling();
    };
    ScriptedFrontend fe;
    App app(Settings::defaults(), {dirs.left.string(), dirs.right.string()},
            &fe, factory, nullptr, quietOptions());
    app.connectProfile(aliceProfile(), 0);
    t.check(pump(app), "failed connect finished");
    t.check(!app.panel(0).isRemote(), "panel stays local");
    t.checkContains(app.statusMessage(), "Connection failed",
                    "failure reported");
    t.check(app.settings().remote_profiles.empty(),
            "failed profile not remembered");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication qapp(argc, argv);
    TempDir config("config");
    ::setenv("OPENDIR_CONFIG_DIR", config.root.c_str(), 1);

    TestContext t;
    test_progress_state(t);
    test_spinner(t);
    test_panel_state(t);
    test_cursor_after_entering(t);
    test_settings_roundtrip(t);
    test_credential_codec(t);
    test_copy_with_conflict(t);
    test_cut_and_paste(t);
    test_encrypt_directory(t);
    test_symlink_exclusion(t);
    test_dialogs(t);
    test_panels_and_quit(t);
    test_quit_waits_for_copy(t);
    test_diff_and_search(t);
    test_remote_flow(t);
    test_remote_connect_failure(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] opendir_app_tests\n";
    return EXIT_SUCCESS;
}
