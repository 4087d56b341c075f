// tests/converter_tests.cpp
// -----------------------------------------------------------------------------
// Unit-tests for the converters, the pipeline, settings and the inspector.
//   * Requires GoogleTest
//   * Test-data are generated into scratch directories (see TestData.hpp)
// -----------------------------------------------------------------------------

#include "TestData.hpp"

#include "dat_toolkit/ConverterFactory.hpp"
#include "dat_toolkit/Converter.hpp"
#include "dat_toolkit/ConversionWorker.hpp"
#include "dat_toolkit/Inspector.hpp"
#include "dat_toolkit/NodesFormat.hpp"
#include "dat_toolkit/Pipeline.hpp"
#include "dat_toolkit/ToolSettings.hpp"

namespace fs = std::filesystem;
using namespace dat_toolkit;
using testdata::ScratchDir;

static bool isPng(const fs::path& p)
{
    auto bytes = testdata::readFile(p);
    static const unsigned char sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (bytes.size() < 8) return false;
    for (int i = 0; i < 8; ++i)
        if (static_cast<unsigned char>(bytes[i]) != sig[i]) return false;
    return true;
}

// -----------------------------------------------------------------------------
// Factory
// -----------------------------------------------------------------------------
TEST(ConverterFactory, KnownAndUnknownIds)
{
    for (const auto& id : ConverterFactory::available())
        EXPECT_TRUE(ConverterFactory::create(id) != nullptr) << id;
    EXPECT_THROW(ConverterFactory::create("nodes2chase"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// chase.dat → nodes.dat
// -----------------------------------------------------------------------------
TEST(Chase2NodesConverter, WritesNodesWithOptions)
{
    ScratchDir dir;
    const auto in  = dir / "chase.dat";
    const auto out = dir / "nodes.dat";
    testdata::writeFile(in, testdata::chase28({{1, 2, 3}, {-1, -2, -3}}));

    Options opt;
    opt.params["multiplier"] = "4";
    opt.params["area_id"]    = "12";
    opt.params["node_type"]  = "1";

    auto conv = ConverterFactory::create("chase2nodes");
    conv->convert(in.string(), out.string(), opt);

    auto nodes = parseNodes(testdata::readFile(out));
    ASSERT_EQ(nodes.totalNodeCount, 2u);
    EXPECT_EQ(nodes.records[1].x, -4);
    EXPECT_EQ(nodes.records[1].z, -12);
    EXPECT_EQ(nodes.records[1].areaId, 12);
    EXPECT_EQ(nodes.records[1].nodeType, 1);
    EXPECT_TRUE(fs::exists(logPathFor(out)));
}

TEST(Chase2NodesConverter, EmptyOutputUsesDefaultName)
{
    ScratchDir dir;
    const auto in = dir / "route.dat";
    testdata::writeFile(in, testdata::chase20({{1, 2, 3}}));

    ConverterFactory::create("chase2nodes")->convert(in.string(), "", Options{});
    EXPECT_TRUE(fs::exists(dir / "route_nodes.dat"));
}

TEST(Chase2NodesConverter, FailureThrows)
{
    ScratchDir dir;
    const auto in = dir / "broken.dat";
    testdata::writeFile(in, std::vector<char>(7, 'z'));

    auto conv = ConverterFactory::create("chase2nodes");
    EXPECT_THROW(conv->convert(in.string(), (dir / "o.dat").string(), Options{}), std::runtime_error);
}

// -----------------------------------------------------------------------------
// nodes.dat → PNG preview, and the chained pipeline
// -----------------------------------------------------------------------------
TEST(Nodes2PngConverter, RendersPreview)
{
    ScratchDir dir;
    const auto nodesPath = dir / "n.dat";
    testdata::writeFile(nodesPath,
        encodeNodes({{0, 0, 0}, {100, 50, 0}, {200, -80, 0}}, ConversionParameters{}).bytes);

    Options opt;
    opt.params["w"] = "256";
    opt.params["h"] = "128";
    ConverterFactory::create("nodes2png")->convert(nodesPath.string(), (dir / "n.png").string(), opt);
    EXPECT_TRUE(isPng(dir / "n.png"));
}

TEST(Nodes2PngConverter, RejectsNonNodesInput)
{
    ScratchDir dir;
    testdata::writeFile(dir / "bad.dat", std::vector<char>(25, '\0'));
    EXPECT_THROW(ConverterFactory::create("nodes2png")->convert((dir / "bad.dat").string(),
                                                                (dir / "bad.png").string(), Options{}),
                 std::runtime_error);
}

TEST(Pipeline, ChaseToPreviewRemovesIntermediates)
{
    ScratchDir dir;
    const auto in  = dir / "chase.dat";
    const auto out = dir / "preview.png";
    testdata::writeFile(in, testdata::chase20({{1, 1, 0}, {5, 9, 0}, {-3, 4, 0}}));

    Pipeline pipeline;
    pipeline.addStep(ConverterFactory::create("chase2nodes"));
    pipeline.addStep(ConverterFactory::create("nodes2png"));
    ASSERT_EQ(pipeline.size(), 2u);

    Options opt;
    opt.params["w"] = "64";
    opt.params["h"] = "64";
    pipeline.run(in.string(), out.string(), opt);

    EXPECT_TRUE(isPng(out));
    EXPECT_FALSE(fs::exists(in.string() + ".tmp0"));
}

// -----------------------------------------------------------------------------
// Settings
// -----------------------------------------------------------------------------
TEST(ToolSettings, Defaults)
{
    ToolSettings s = ToolSettings::fromOptions(Options{});
    EXPECT_DOUBLE_EQ(s.params.multiplier, 8.0);
    EXPECT_EQ(s.params.areaId, 0);
    EXPECT_EQ(s.params.width, 0);
    EXPECT_EQ(s.params.nodeType, 0);
    EXPECT_EQ(s.params.flags, 0);
    EXPECT_TRUE(s.backup);
    EXPECT_EQ(s.threads, 4);
    EXPECT_EQ(s.maxPreview, 200u);
}

TEST(ToolSettings, ParsesAndValidates)
{
    Options o;
    o.params["multiplier"] = "16.5";
    o.params["width"]      = "0xFFFF";
    o.params["flags"]      = "255";
    o.params["backup"]     = "false";
    o.params["threads"]    = "64";
    ToolSettings s = ToolSettings::fromOptions(o);
    EXPECT_DOUBLE_EQ(s.params.multiplier, 16.5);
    EXPECT_EQ(s.params.width, 0xFFFF);
    EXPECT_EQ(s.params.flags, 255);
    EXPECT_FALSE(s.backup);
    EXPECT_EQ(s.threads, 64);    // the orchestrator clamps, not the settings

    Options dec;
    dec.params["area_id"] = "010";
    dec.params["width"]   = "0x10";
    ToolSettings d = ToolSettings::fromOptions(dec);
    EXPECT_EQ(d.params.areaId, 10);     // leading zero is not octal
    EXPECT_EQ(d.params.width, 16);

    Options bad;
    bad.params["area_id"] = "70000";
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
    bad.params = {{"multiplier", "eight"}};
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
    bad.params = {{"node_type", "-1"}};
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
    bad.params = {{"width", "0x-5"}};
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
    bad.params = {{"flags", "0x"}};
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
    bad.params = {{"backup", "maybe"}};
    EXPECT_THROW(ToolSettings::fromOptions(bad), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Inspector
// -----------------------------------------------------------------------------
TEST(Inspector, ChaseFile)
{
    ScratchDir dir;
    testdata::writeFile(dir / "c.dat", testdata::chase28({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}}));
    InspectReport r = inspectFile(dir / "c.dat", 2);
    EXPECT_EQ(r.kind, FileKind::Chase);
    EXPECT_EQ(r.variant, RecordVariant::TwentyEight);
    EXPECT_EQ(r.entries, 3u);
    EXPECT_EQ(r.status, "OK");
    ASSERT_EQ(r.chasePreview.size(), 2u);
    EXPECT_FLOAT_EQ(r.chasePreview[1].y, 5.0f);
    EXPECT_EQ(describe(r), "c.dat: variant=28, entries=3");
}

TEST(Inspector, NodesFileWinsOverChaseLength)
{
    // 20 + 24 * 10 = 260 bytes, which is also a multiple of 20
    ScratchDir dir;
    std::vector<Position> pts(10, Position{1, 2, 3});
    testdata::writeFile(dir / "n.dat", encodeNodes(pts, ConversionParameters{}).bytes);

    InspectReport r = inspectFile(dir / "n.dat", 200);
    EXPECT_EQ(r.kind, FileKind::Nodes);
    EXPECT_EQ(r.entries, 10u);
    EXPECT_EQ(r.nodePreview.size(), 10u);
    EXPECT_EQ(r.nodePreview[9].nodeId, 9);
}

TEST(Inspector, OtherShapes)
{
    ScratchDir dir;
    testdata::writeFile(dir / "tiny.dat", std::vector<char>(7, '\0'));
    std::vector<char> odd(25, '\0');
    odd[0] = 3;
    testdata::writeFile(dir / "odd.dat", odd);

    EXPECT_EQ(inspectFile(dir / "tiny.dat", 10).kind, FileKind::TooSmall);

    InspectReport r = inspectFile(dir / "odd.dat", 10);
    EXPECT_EQ(r.kind, FileKind::NodesLike);
    EXPECT_EQ(r.entries, 3u);
    EXPECT_EQ(r.status, "NodeFile?");

    fs::create_directories(dir / "folder.dat");
    InspectReport folder;
    EXPECT_NO_THROW(folder = inspectFile(dir / "folder.dat", 10));
    EXPECT_EQ(folder.kind, FileKind::Error);
    EXPECT_EQ(folder.status.rfind("Err: ", 0), 0u);

    InspectReport missing = inspectFile(dir / "nope.dat", 10);
    EXPECT_EQ(missing.kind, FileKind::Error);
    EXPECT_EQ(missing.status.rfind("Err: ", 0), 0u);
}

// -----------------------------------------------------------------------------
// Register with main()
// -----------------------------------------------------------------------------
int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
