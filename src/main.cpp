#include "keypass_common.hpp"
#include "logging.hpp"
#include "util.hpp"
#include "io.hpp"
#include "db.hpp"
#include "master_gate.hpp"
#include "password_generator.hpp"
#include "service.hpp"
#include "vault.hpp"

// ---------------- output helpers ----------------
static void print_record(const CredentialRecord& r) {
    std::cout << "  [" << r.id << "] " << r.title << " / " << r.username << "\n";
    std::cout << "      url:      " << r.url << "\n";
    std::cout << "      password: " << r.password << "\n";
}

static void print_response(ServiceResponse& resp) {
    if (!resp.ok()) {
        std::cout << "Error " << resp.status << ": " << resp.detail << "\n";
        return;
    }
    for (const auto& t : resp.titles) {
        std::cout << " - " << t << "\n";
    }
    for (auto& r : resp.records) {
        print_record(r);
        wipe_string(r.password);
    }
    if (!resp.detail.empty()) {
        std::cout << resp.detail << "\n";
    }
}

static bool ask_yes_no(const char* prompt, bool& out) {
    std::string answer;
    if (!read_line(prompt, answer)) return false;
    trim_spaces(answer);
    out = (answer == "y" || answer == "Y" || answer == "yes");
    return true;
}

// Empty input leaves the password absent
static bool ask_password(const char* prompt, std::optional<std::string>& out) {
    SecureBuffer pw;
    if (!get_password_secure(prompt, pw)) return false;
    if (pw.empty()) out.reset();
    else out = pw.str();
    return true;
}

// ---------------- menu actions ----------------
static bool action_add(VaultContext& ctx) {
    CredentialEntry e;
    std::string url;
    if (!read_line("Title: ", e.title)) return false;
    if (!read_line("Username: ", e.username)) return false;
    if (!read_line("URL (empty for N/A): ", url)) return false;
    if (!url.empty()) e.url = url;
    if (!ask_yes_no("Generate password? [y/N]: ", e.generate)) return false;
    if (!e.generate && !ask_password("Password: ", e.password)) return false;

    ServiceResponse resp = handle_create(ctx, e);
    if (e.password) wipe_string(*e.password);
    print_response(resp);
    return true;
}

static bool action_update(VaultContext& ctx) {
    CredentialUpdate u;
    std::string url;
    if (!read_line("Title: ", u.title)) return false;
    if (!read_line("Username: ", u.username)) return false;
    if (!read_line("New URL (empty to keep): ", url)) return false;
    if (!url.empty()) u.url = url;
    if (!ask_yes_no("Generate new password? [y/N]: ", u.generate)) return false;
    if (!u.generate && !ask_password("New password (empty to keep): ", u.password)) return false;

    ServiceResponse resp = handle_update(ctx, u);
    if (u.password) wipe_string(*u.password);
    print_response(resp);
    return true;
}

static bool action_pair(VaultContext& ctx, bool remove) {
    std::string title, username;
    if (!read_line("Title: ", title)) return false;
    if (!read_line("Username: ", username)) return false;
    ServiceResponse resp = remove
        ? handle_delete(ctx, title, username)
        : handle_read_one(ctx, title, username);
    print_response(resp);
    return true;
}

static bool action_read_title(VaultContext& ctx) {
    std::string title;
    if (!read_line("Title: ", title)) return false;
    ServiceResponse resp = handle_read_title(ctx, title);
    print_response(resp);
    return true;
}

static bool action_generate() {
    std::string len_s;
    if (!read_line("Length (empty for 16): ", len_s)) return false;
    trim_spaces(len_s);
    int len = len_s.empty() ? DEFAULT_GENERATED_LEN : parse_choice(len_s);

    std::string pw;
    if (generate_password(pw, len) != VaultStatus::OK) {
        std::cout << "Length must be between 1 and " << MAX_PASS_LEN << ".\n";
        return true;
    }
    std::cout << pw << "\n";
    wipe_string(pw);
    return true;
}

static int run(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "libsodium initialization failed.\n");
        return EXIT_INIT_FAILED;
    }
    init_log_context();

    VaultPaths paths;
    if (!init_vault_paths(argc > 1 ? argv[1] : nullptr, paths)) {
        std::fprintf(stderr, "Failed to initialize vault paths.\n");
        return EXIT_INIT_FAILED;
    }
    set_log_path(paths.log_path, paths.dir);
    log_event(LogLevel::INFO,
        "keypass starting, vault dir: " + paths.dir,
        "session",
        "notify");

    if (migrate_schema(paths.db_path) != VaultStatus::OK) {
        std::cerr << "An unexpected error occurred. Check the log.\n";
        return EXIT_INIT_FAILED;
    }

    // ---------------- Master password gate ----------------
    VaultContext ctx(paths.db_path);
    VaultStatus st = unlock_vault(ctx, get_password_secure);
    if (st == VaultStatus::LOCKED) {
        return EXIT_LOCKED;
    }
    if (st != VaultStatus::OK) {
        std::cerr << "Vault not opened: " << vault_status_str(st) << "\n";
        return EXIT_GATE_ABORTED;
    }

    // ---------------- Main CLI loop ----------------
    bool running = true;
    while (running) {
        print_menu();
        std::string choice;
        if (!read_line("> ", choice)) {
            break; // EOF or stdin closed
        }
        trim_spaces(choice);

        bool more = true;
        switch (parse_choice(choice)) {
        case 1: {
            ServiceResponse resp = handle_list_titles(ctx);
            print_response(resp);
            break;
        }
        case 2: more = action_read_title(ctx); break;
        case 3: more = action_pair(ctx, false); break;
        case 4: more = action_add(ctx); break;
        case 5: more = action_update(ctx); break;
        case 6: more = action_pair(ctx, true); break;
        case 7: more = action_generate(); break;
        case 8: running = false; break;
        default:
            std::cout << "Unknown option\n";
            break;
        }
        if (!more) break;
    }

    clear_screen();
    std::cout << "Goodbye.\n";
    log_event(LogLevel::INFO,
        "Session ended normally",
        "session",
        "success");
    return 0;
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        // SecureBuffer allocation/mlock failures
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        log_event(LogLevel::ERROR,
            std::string("Fatal: ") + e.what(),
            "session",
            "failure");
        return EXIT_INIT_FAILED;
    }
}
