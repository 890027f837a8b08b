#include "console.hpp"

#include <atomic>
#include <mutex>

namespace {

std::atomic<bool> debugEnabled{false};

// Сообщения из разных потоков не должны перемешиваться
std::mutex outputMutex;

void writeLine(std::ostream& stream, const char* color, const char* prefix,
               const std::string& message) {
    std::lock_guard<std::mutex> lock(outputMutex);
    stream << color << prefix << Color::RESET << message << "\n";
}

} // namespace

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    veq — визуализатор уравнений y = f(x, t) v1.3          ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void setDebugLogging(bool enabled) {
    debugEnabled.store(enabled);
}

bool isDebugLogging() {
    return debugEnabled.load();
}

void logDebug(const std::string& message) {
    if (!debugEnabled.load()) {
        return;
    }
    writeLine(std::cerr, Color::GRAY, "[debug] ", message);
}

void logInfo(const std::string& message) {
    writeLine(std::cout, Color::CYAN, "[info] ", message);
}

void logWarning(const std::string& message) {
    writeLine(std::cerr, Color::YELLOW, "Внимание: ", message);
}

void logError(const std::string& message) {
    writeLine(std::cerr, Color::RED, "✗ Ошибка: ", message);
}
