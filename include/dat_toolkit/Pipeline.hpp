#pragma once
#include "Converter.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace dat_toolkit {

class Pipeline {
    std::vector<std::unique_ptr<IConverter>> steps_;
public:
    void addStep(std::unique_ptr<IConverter> step) {
        steps_.push_back(std::move(step));
    }

    std::size_t size() const { return steps_.size(); }

    // Output of each step is the input of the next. Intermediate files sit
    // beside the input as <input>.tmp<i> and are removed afterwards.
    void run(const std::string& input, const std::string& finalOutput, const Options& opts) {
        std::vector<std::string> temps;
        std::string curInput = input;
        try {
            for (size_t i = 0; i < steps_.size(); ++i) {
                const bool last = i + 1 == steps_.size();
                std::string outPath = last ? finalOutput
                                           : input + ".tmp" + std::to_string(i);
                if (!last) temps.push_back(outPath);
                steps_[i]->convert(curInput, outPath, opts);
                curInput = outPath;
            }
        } catch (...) {
            removeTemps(temps);
            throw;
        }
        removeTemps(temps);
    }

private:
    static void removeTemps(const std::vector<std::string>& temps) {
        for (const auto& t : temps) {
            std::error_code ec;
            std::filesystem::remove(t, ec);     // best effort; the file may never have been written
        }
    }
};

} // namespace dat_toolkit
