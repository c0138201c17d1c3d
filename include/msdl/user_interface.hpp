//
//  user_interface.hpp
//
//  Terminal output helpers for the msdl command line
//

#ifndef MSDL_USER_INTERFACE_HPP
#define MSDL_USER_INTERFACE_HPP

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace msdl {

class UserInterface {
public:
    // Renders one bar line, e.g. "config.json [█████▶░░░] 42.0%  1.2 MB / 3.0 MB"
    static std::string RenderBar(const std::string& label, double progress, const std::string& suffix,
                                 int bar_width = 30) {
        if (progress < 0.0) progress = 0.0;
        if (progress > 1.0) progress = 1.0;
        int pos = static_cast<int>(bar_width * progress);
        std::string line = label + " [";
        for (int i = 0; i < bar_width; ++i) {
            if (i < pos) {
                line += "█";
            } else if (i == pos) {
                line += "▶";
            } else {
                line += "░";
            }
        }
        std::ostringstream pct;
        pct << std::fixed << std::setprecision(1) << (progress * 100.0) << "%";
        line += "] " + pct.str();
        if (!suffix.empty()) {
            line += "  " + suffix;
        }
        return line;
    }

    static void ShowError(const std::string& error, const std::string& suggestion = "") {
        std::cerr << "❌ Error: " << error << std::endl;
        if (!suggestion.empty()) {
            std::cerr << "💡 Suggestion: " << suggestion << std::endl;
        }
    }

    static void ShowSuccess(const std::string& message) {
        std::cout << "✅ " << message << std::endl;
    }

    static void ShowInfo(const std::string& message) {
        std::cout << "ℹ️  " << message << std::endl;
    }
};

} // namespace msdl

#endif // MSDL_USER_INTERFACE_HPP
