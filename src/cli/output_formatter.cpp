#include <mcphub/cli/output_formatter.hpp>
#include <mcphub/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace mcphub {

namespace {

using namespace mcphub::ansi;

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            auto object = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                object[headers[c]] = row[c];
            }
            array.push_back(std::move(object));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (rows.empty()) {
        out_ << "(none)\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            auto padded = row;
            padded.resize(headers.size());
            table_data.push_back(std::move(padded));
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No trailing padding on the last column.
            if (c + 1 == headers.size()) {
                out_ << cells[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& value) const {
    out_ << (json_mode_ ? value.dump() : value.dump(2)) << "\n";
}

void OutputFormatter::PrintText(const std::string& text) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"text", text}}.dump() << "\n";
        return;
    }
    out_ << text;
    if (text.empty() || text.back() != '\n') {
        out_ << "\n";
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << Paint(kRed, "Error: ") << Paint(kBold, error.operation);
        err_ << Paint(kDim, " [" + error.CategoryName() + "]");
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.target.empty()) {
            err_ << "  " << kDim << "Target: " << kReset << error.target << "\n";
        }
        if (error.rpc_code.has_value()) {
            err_ << "  " << kYellow << "JSON-RPC code: " << kReset
                 << error.rpc_code.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation << " [" << error.CategoryName() << "]";
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.target.empty()) {
        err_ << "  Target: " << error.target << "\n";
    }
    if (error.rpc_code.has_value()) {
        err_ << "  JSON-RPC code: " << error.rpc_code.value() << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << Paint(kGreen, "OK") << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace mcphub
