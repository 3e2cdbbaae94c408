/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <iostream>
#include <optional>
#include <string>
#include <termios.h>
#include <unistd.h>
#include "HttpApi.hpp"
#include "atomic_file.hpp"
#include "config.hpp"
#include "credential_gate.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "record_store.hpp"
#include "session.hpp"
#include "settings_store.hpp"

using namespace tally;

// Reads one line from the terminal without echoing it. nullopt on EOF.
static std::optional<std::string> read_hidden_line() {
    termios old_attrs{};
    bool is_tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_attrs) == 0;
    if (is_tty) {
        termios silent = old_attrs;
        silent.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }

    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_attrs);
        std::cout << std::endl;
    }
    if (!ok) return std::nullopt;
    return line;
}

// Applies the configured corrupt-file policy around a store load.
template <typename Store>
static void load_store(Store& store, const Config& config) {
    try {
        store.load();
    } catch (const CorruptDataError& e) {
        if (config.on_corrupt == CorruptPolicy::Abort) {
            log_event("FATAL", std::string(e.what()) + " Set \"on_corrupt\": \"start-empty\" to move it aside and continue.");
            throw;
        }
        std::string aside = quarantine_file(store.path());
        log_event("WARN", std::string(e.what()) + " Moved to " + aside + "; starting empty.");
        store.load();
    }
}

int main() {
    try {
        Config config = load_config();

        RecordStore records(config.transactions_path());
        SettingsStore settings(config.settings_path(), config.pin_kdf_iterations);
        load_store(records, config);
        load_store(settings, config);

        // === [SEARCH: PIN GATE] ===
        PinGate gate(settings.pin_credential(), config.max_pin_attempts);
        std::string accepted;
        try {
            bool opened = gate.unlock([&](int remaining) -> std::optional<std::string> {
                std::cout << "Enter PIN (" << remaining << " attempt(s) left): " << std::flush;
                std::optional<std::string> pin = read_hidden_line();
                if (pin) accepted = *pin;
                return pin;
            });
            if (!opened) {
                log_event("INFO", "Session ended at PIN prompt.");
                return 1;
            }
        } catch (const AuthExhausted& e) {
            log_event("FATAL", e.what());
            return 3;
        }

        // Older settings files carry an unsalted hash; upgrade it now that we know the PIN.
        if (gate.required() && TallyCrypto::needs_rehash(*settings.pin_credential(), config.pin_kdf_iterations)) {
            settings.set_pin(accepted);
            log_event("INFO", "Stored PIN hash upgraded to PBKDF2.");
        }

        // The token only ever goes to the console, never to the log buffer.
        SessionGuard session = SessionGuard::generate();
        std::cout << "Open the dashboard: http://" << config.bind_address << ":" << config.port
                  << "/?session=" << session.token() << std::endl;

        log_event("INFO", "Tally: Personal Finance Tracker active.");
        AppContext app{config, records, settings, session};
        return run_http_server(app) ? 0 : 2;
    } catch (const TallyError& e) {
        log_event("FATAL", std::string(e.kind()) + ": " + e.what());
        return 2;
    } catch (const std::exception& e) {
        log_event("FATAL", e.what());
        return 2;
    }
}
