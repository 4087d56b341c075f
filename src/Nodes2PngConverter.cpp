/*============================================================================
  Nodes2PngConverter.cpp  –  part of dat_toolkit
  --------------------------------------------------------------------------
  Renders a nodes.dat as seen from above: node x → image right, node y →
  image up, fitted into w×h with a margin. Consecutive nodes are joined so
  the chase route is visible; the first node is drawn in green.

  Params: w, h (1024), margin (32), radius (2), max_nodes (0 = all)
============================================================================*/

#include "dat_toolkit/Nodes2PngConverter.hpp"
#include "dat_toolkit/FileStream.hpp"
#include "dat_toolkit/NodesFormat.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace dat_toolkit {

// ─────────────────────── option helpers ────────────────────────────────────
static int optI(const Options& o, const std::string& k, int def)
{
    auto it = o.params.find(k);
    return it == o.params.end() ? def : std::stoi(it->second);
}

// ───────────────────────────── convert() ───────────────────────────────────
void Nodes2PngConverter::convert(const std::string& inPath,
                                 const std::string& outPath,
                                 const Options&     opts)
{
    const int W      = std::max(16, optI(opts, "w", 1024));
    const int H      = std::max(16, optI(opts, "h", 1024));
    const int margin = std::clamp(optI(opts, "margin", 32), 0, std::min(W, H) / 4);
    const int radius = std::max(1, optI(opts, "radius", 2));
    const int limit  = std::max(0, optI(opts, "max_nodes", 0));

    NodesFile nodes = parseNodes(FileReader::readAll(inPath));
    if (limit > 0 && nodes.records.size() > static_cast<std::size_t>(limit))
        nodes.records.resize(static_cast<std::size_t>(limit));

    cv::Mat img(H, W, CV_8UC3, cv::Scalar::all(24));

    if (!nodes.records.empty()) {
        // ---------- bounding box → pixel transform -------------------------
        int minX = std::numeric_limits<int>::max(), maxX = std::numeric_limits<int>::min();
        int minY = minX, maxY = maxX;
        for (const auto& r : nodes.records) {
            minX = std::min(minX, int(r.x)); maxX = std::max(maxX, int(r.x));
            minY = std::min(minY, int(r.y)); maxY = std::max(maxY, int(r.y));
        }
        const double spanX = std::max(1, maxX - minX);
        const double spanY = std::max(1, maxY - minY);
        const double scale = std::min((W - 2.0 * margin) / spanX, (H - 2.0 * margin) / spanY);
        // centre the smaller axis
        const double offX = margin + ((W - 2.0 * margin) - spanX * scale) * 0.5;
        const double offY = margin + ((H - 2.0 * margin) - spanY * scale) * 0.5;

        std::vector<cv::Point> pts;
        pts.reserve(nodes.records.size());
        for (const auto& r : nodes.records)
            pts.emplace_back(cvRound(offX + (r.x - minX) * scale),
                             cvRound(H - 1 - (offY + (r.y - minY) * scale)));

        // ---------- draw -------------------------------------------------
        if (pts.size() > 1)
            cv::polylines(img, std::vector<std::vector<cv::Point>>{pts}, false,
                          cv::Scalar(90, 90, 200), 1, cv::LINE_AA);
        for (const auto& p : pts)
            cv::circle(img, p, radius, cv::Scalar(230, 230, 230), cv::FILLED, cv::LINE_AA);
        cv::circle(img, pts.front(), radius + 2, cv::Scalar(60, 220, 60), cv::FILLED, cv::LINE_AA);
    }

    // ---------- store output ---------------------------------------------
    std::filesystem::path out = outPath.empty()
        ? std::filesystem::path(inPath).replace_extension(".png")
        : std::filesystem::path(outPath);

    // encode explicitly: pipeline temp names carry no image extension
    std::vector<uchar> png;
    if (!cv::imencode(".png", img, png))
        throw std::runtime_error("PNG encoding failed for " + out.string());
    FileWriter::writeAll(out.string(), std::vector<char>(png.begin(), png.end()));

    std::cout << "[nodes2png] " << nodes.records.size() << " nodes → " << out.string()
              << " (" << W << "×" << H << ")\n";
}

} // namespace dat_toolkit
