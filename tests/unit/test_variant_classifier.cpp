/**
 * @file test_variant_classifier.cpp
 * @brief Unit tests for variant detection and model assembly
 */

#include <fixtures.hpp>
#include <extraction/variant_classifier.hpp>
#include <pipeline/converter.hpp>
#include <pipeline/model_summary.hpp>
#include <source/flat_record_adapter.hpp>
#include <source/hierarchical_adapter.hpp>

using namespace FemCanon;
using namespace FemCanon::testing;

// ============================================================================
// Detection
// ============================================================================

TEST(VariantClassifierTest, AllModalKeysMeanModal) {
    HierarchicalAdapter adapter(hierarchical_modal_source());
    EXPECT_EQ(detect_variant(adapter), ModelVariant::Modal);
}

TEST(VariantClassifierTest, GainMatrixMeansStatic) {
    HierarchicalAdapter adapter(hierarchical_static_source());
    EXPECT_EQ(detect_variant(adapter), ModelVariant::StaticReduction);
}

TEST(VariantClassifierTest, ModalWinsOverGainMatrix) {
    SourceDocument doc = hierarchical_modal_source();
    doc["gainMatrix"] = {9.0};
    HierarchicalAdapter adapter(doc);
    EXPECT_EQ(detect_variant(adapter), ModelVariant::Modal);
}

TEST(VariantClassifierTest, PartialModalPayloadIsStaticOrNothing) {
    SourceDocument doc = hierarchical_modal_source();
    doc.erase("proportionalDampingVec");
    EXPECT_FALSE(detect_variant(HierarchicalAdapter(doc)).has_value());

    doc["gainMatrix"] = {1.0};
    EXPECT_EQ(detect_variant(HierarchicalAdapter(doc)), ModelVariant::StaticReduction);
}

TEST(VariantClassifierTest, NullPayloadCountsAsAbsent) {
    SourceDocument doc = hierarchical_modal_source();
    doc["eigenfrequencies"] = nullptr;
    EXPECT_FALSE(detect_variant(HierarchicalAdapter(doc)).has_value());
}

TEST(VariantClassifierTest, EmptyGainMatrixIsUnsupported) {
    SourceDocument doc = hierarchical_static_source();
    doc["gainMatrix"] = SourceDocument::array();
    HierarchicalAdapter adapter(doc);
    ExtractionStats stats;

    EXPECT_FALSE(detect_variant(adapter).has_value());
    EXPECT_FALSE(build_canonical_model(adapter, stats).has_value());
}

TEST(VariantClassifierTest, EmptyModalArraysFallThroughToGain) {
    SourceDocument doc = hierarchical_modal_source();
    doc["eigenfrequencies"] = SourceDocument::array();
    doc["inputs2ModalF"] = SourceDocument::array();
    doc["modalDisp2Outputs"] = SourceDocument::array();
    doc["proportionalDampingVec"] = SourceDocument::array();
    EXPECT_FALSE(detect_variant(HierarchicalAdapter(doc)).has_value());

    doc["gainMatrix"] = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    ExtractionStats stats;
    auto model = build_canonical_model(HierarchicalAdapter(doc), stats);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->variant, ModelVariant::StaticReduction);
    EXPECT_TRUE(model->modal.empty());
    EXPECT_FALSE(model->static_gain.empty());
}

TEST(VariantClassifierTest, OneEmptyModalArrayIsNotModal) {
    SourceDocument doc = hierarchical_modal_source();
    doc["eigenfrequencies"] = SourceDocument::array({SourceDocument::array()});
    EXPECT_FALSE(detect_variant(HierarchicalAdapter(doc)).has_value());
}

// ============================================================================
// Assembly
// ============================================================================

TEST(VariantClassifierTest, ModalModelCarriesFlattenedPayload) {
    HierarchicalAdapter adapter(hierarchical_modal_source());
    ExtractionStats stats;
    auto model = build_canonical_model(adapter, stats);

    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->variant, ModelVariant::Modal);
    EXPECT_EQ(model->model_description, "GMT structural model, modal 2nd order");
    EXPECT_EQ(model->modal.eigenfrequencies, (std::vector<double>{0.0, 0.0, 1.5, 2.25}));
    EXPECT_EQ(model->modal.inputs_to_modal_force, (std::vector<double>{0.1, 0.2, 0.3, 0.4}));
    EXPECT_EQ(model->modal.modal_displacement_to_outputs, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));
    EXPECT_TRUE(model->static_gain.empty());
    EXPECT_EQ(model->n_inputs(), 3u);
    EXPECT_EQ(model->n_outputs(), 2u);
    EXPECT_EQ(model->n_modes(), 4u);
}

TEST(VariantClassifierTest, StaticModelHasEmptyModalPayload) {
    HierarchicalAdapter adapter(hierarchical_static_source());
    ExtractionStats stats;
    auto model = build_canonical_model(adapter, stats);

    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->variant, ModelVariant::StaticReduction);
    EXPECT_TRUE(model->modal.empty());
    EXPECT_EQ(model->static_gain.gain_matrix.size(), 6u);
}

TEST(VariantClassifierTest, UnsupportedVariantYieldsNothing) {
    SourceDocument doc = hierarchical_static_source();
    doc.erase("gainMatrix");
    HierarchicalAdapter adapter(doc);
    ExtractionStats stats;

    EXPECT_FALSE(build_canonical_model(adapter, stats).has_value());
}

TEST(VariantClassifierTest, MissingDescriptionIsFatal) {
    SourceDocument doc = hierarchical_modal_source();
    doc.erase("modelDescription");
    HierarchicalAdapter adapter(doc);
    ExtractionStats stats;

    expect_conversion_error([&] { build_canonical_model(adapter, stats); },
                            ErrorKind::MandatoryFieldMissing);
}

TEST(VariantClassifierTest, DescriptionDecodingFollowsGeneration) {
    SourceDocument doc = hierarchical_modal_source();
    doc["modelDescription"] = raw_bytes({0x47, 0x4D, 0xFF, 0x54});
    ExtractionStats stats;

    auto model = build_canonical_model(HierarchicalAdapter(doc), stats);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->model_description, "GMT");

    FlatRecordAdapter flat(to_flat_layout(doc));
    expect_conversion_error([&] { build_canonical_model(flat, stats); },
                            ErrorKind::TextDecodeError);
}

TEST(VariantClassifierTest, NonNumericPayloadIsInvalid) {
    SourceDocument doc = hierarchical_modal_source();
    doc["proportionalDampingVec"] = {0.02, "high"};
    HierarchicalAdapter adapter(doc);
    ExtractionStats stats;

    expect_conversion_error([&] { build_canonical_model(adapter, stats); },
                            ErrorKind::InvalidFieldValue);
}

// ============================================================================
// Summary
// ============================================================================

TEST(ModelSummaryTest, ModalSummaryListsModesAndGroups) {
    ExtractionStats stats;
    auto model = build_canonical_model(HierarchicalAdapter(hierarchical_modal_source()), stats);
    ASSERT_TRUE(model.has_value());

    std::string summary = format_summary(*model, "test");
    EXPECT_NE(summary.find("# of modes: 4"), std::string::npos);
    EXPECT_NE(summary.find("OSS_Truss_6F: [    2]"), std::string::npos);
    EXPECT_NE(summary.find("Total: [    3]"), std::string::npos);
    EXPECT_NE(summary.find("[0.0200;0.0200]"), std::string::npos);
}

TEST(ModelSummaryTest, StaticSummaryChecksGainShape) {
    ExtractionStats stats;
    auto model = build_canonical_model(HierarchicalAdapter(hierarchical_static_source()), stats);
    ASSERT_TRUE(model.has_value());

    std::string summary = format_summary(*model, "test");
    EXPECT_NE(summary.find("6 coefficients (2 outputs x 3 inputs)"), std::string::npos);

    model->static_gain.gain_matrix.pop_back();
    summary = format_summary(*model, "test");
    EXPECT_NE(summary.find("expected 6"), std::string::npos);
}
