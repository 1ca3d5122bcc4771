#include "infrastructure/TesseractCliEngine.hpp"
#include "infrastructure/ShellUtils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace bidlens::infrastructure {

namespace {

constexpr int kWordLevel = 5;
constexpr std::size_t kTsvColumns = 12;

std::vector<std::string> SplitTabs(const std::string& line) {
    std::vector<std::string> cols;
    std::stringstream ss(line);
    std::string col;
    while (std::getline(ss, col, '\t')) cols.push_back(col);
    return cols;
}

} // namespace

TesseractCliEngine::TesseractCliEngine(std::string language)
    : m_language(std::move(language)) {}

bool TesseractCliEngine::isAvailable() {
    return ShellUtils::FindInPath("tesseract");
}

std::vector<domain::TextFragment> TesseractCliEngine::recognize(const cv::Mat& image) {
    if (image.empty()) return {};

    const std::string pngPath = ShellUtils::UniqueTempPath(".png");
    if (!cv::imwrite(pngPath, image)) {
        throw std::runtime_error("could not write temporary image " + pngPath);
    }

    const CommandResult run = ShellUtils::Capture(
        "tesseract " + ShellUtils::Quote(pngPath) + " stdout -l " + ShellUtils::Quote(m_language) +
        " --psm 6 tsv 2>/dev/null");

    std::error_code ec;
    std::filesystem::remove(pngPath, ec);
    if (!run.ok()) {
        throw std::runtime_error("tesseract exited with status " + std::to_string(run.exitCode));
    }
    return ParseTsv(run.output);
}

std::vector<domain::TextFragment> TesseractCliEngine::ParseTsv(const std::string& tsv) {
    struct Line {
        std::string key;
        std::string text;
        double confSum = 0.0;
        int words = 0;
    };
    std::vector<Line> lines;

    std::stringstream ss(tsv);
    std::string row;
    bool header = true;
    while (std::getline(ss, row)) {
        if (!row.empty() && row.back() == '\r') row.pop_back();
        if (header) { header = false; continue; }

        auto cols = SplitTabs(row);
        if (cols.size() < kTsvColumns) continue;

        int level = 0;
        double conf = -1.0;
        try {
            level = std::stoi(cols[0]);
            conf = std::stod(cols[10]);
        } catch (const std::exception&) {
            continue;
        }
        const std::string& word = cols[11];
        if (level != kWordLevel || conf < 0.0 || word.find_first_not_of(" ") == std::string::npos) continue;

        std::string key = cols[2] + ":" + cols[3] + ":" + cols[4];
        auto it = std::find_if(lines.begin(), lines.end(), [&](const Line& l) { return l.key == key; });
        if (it == lines.end()) {
            lines.push_back(Line{key, {}, 0.0, 0});
            it = std::prev(lines.end());
        }
        if (!it->text.empty()) it->text += " ";
        it->text += word;
        it->confSum += conf;
        ++it->words;
    }

    std::vector<domain::TextFragment> fragments;
    for (const auto& line : lines) {
        domain::TextFragment fragment;
        fragment.text = line.text;
        fragment.confidence = std::clamp(line.confSum / line.words / 100.0, 0.0, 1.0);
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

} // namespace bidlens::infrastructure
