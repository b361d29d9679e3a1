/**
 * @file fixtures.hpp
 * @brief Source record builders shared by the unit and integration suites
 */

#pragma once

#include <gtest/gtest.h>
#include <model/errors.hpp>
#include <source/source_reader.hpp>
#include <utils/logger.hpp>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace FemCanon::testing {

// Keep the console clean while the suites run
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { Logger::set_threshold(Logger::Level::Silent); }
};

inline ::testing::Environment* const k_quiet_logs =
    ::testing::AddGlobalTestEnvironment(new QuietLogs);

// Text as the exporters write it: an array of byte values
inline SourceDocument bytes(const std::string& text) {
    SourceDocument out = SourceDocument::array();
    for (unsigned char c : text) out.push_back(static_cast<unsigned>(c));
    return out;
}

inline SourceDocument raw_bytes(std::initializer_list<unsigned> values) {
    SourceDocument out = SourceDocument::array();
    for (unsigned v : values) out.push_back(v);
    return out;
}

inline SourceDocument input_channel(const std::string& type, const std::string& description,
                                    SourceDocument excite_ids, SourceDocument indices,
                                    SourceDocument properties) {
    SourceDocument channel = SourceDocument::object();
    channel["types"] = bytes(type);
    channel["exciteIDs"] = std::move(excite_ids);
    channel["descriptions"] = bytes(description);
    channel["indices"] = std::move(indices);
    channel["properties"] = std::move(properties);
    return channel;
}

inline SourceDocument output_channel(const std::string& type, const std::string& description,
                                     SourceDocument indices, SourceDocument properties) {
    SourceDocument channel = SourceDocument::object();
    channel["types"] = bytes(type);
    channel["descriptions"] = bytes(description);
    channel["indices"] = std::move(indices);
    channel["properties"] = std::move(properties);
    return channel;
}

/**
 * @brief Small modal model in the hierarchical layout.
 *
 * Inputs:  OSS_M1_lcl_6F (1 channel), OSS_Truss_6F (2 channels)
 * Outputs: OSS_M1_lcl (2 channels, one without csNumber)
 */
inline SourceDocument hierarchical_modal_source() {
    SourceDocument doc = SourceDocument::object();
    doc["modelDescription"] = bytes("GMT structural model, modal 2nd order");

    SourceDocument m1_props = SourceDocument::object();
    m1_props["csLabel"] = bytes("OSS_M1_lcl");
    m1_props["nodeID"] = {101};

    SourceDocument truss_props_0 = SourceDocument::object();
    truss_props_0["csLabel"] = bytes("OSS_Truss");
    truss_props_0["nodeID"] = {201};
    truss_props_0["csNumber"] = {7};
    truss_props_0["location"] = {0.5, 1.25, -2.0};

    SourceDocument truss_props_1 = truss_props_0;
    truss_props_1["nodeID"] = {202};

    doc["fem_inputs"] = SourceDocument::object();
    doc["fem_inputs"]["OSS_M1_lcl_6F"] = SourceDocument::array({
        input_channel("F", "M1 local 6F", {1}, {10, 11, 12}, m1_props)
    });
    doc["fem_inputs"]["OSS_Truss_6F"] = SourceDocument::array({
        input_channel("F", "Truss force 0", {2}, {20, 21}, truss_props_0),
        input_channel("M", "Truss moment 1", {3}, {22, 23}, truss_props_1)
    });

    SourceDocument out_props_0 = SourceDocument::object();
    out_props_0["csLabel"] = bytes("OSS_M1_lcl");
    out_props_0["nodeID"] = {301};
    out_props_0["csNumber"] = {4};
    out_props_0["component"] = {1, -2};

    SourceDocument out_props_1 = SourceDocument::object();
    out_props_1["csLabel"] = bytes("OSS_M1_lcl");
    out_props_1["nodeID"] = {302};
    out_props_1["component"] = {3};

    doc["fem_outputs"] = SourceDocument::object();
    doc["fem_outputs"]["OSS_M1_lcl"] = SourceDocument::array({
        output_channel("D", "M1 displacement 0", {30, 31, 32}, out_props_0),
        output_channel("D", "M1 displacement 1", {33}, out_props_1)
    });

    doc["eigenfrequencies"] = {0.0, 0.0, 1.5, 2.25};
    doc["inputs2ModalF"] = SourceDocument::array({{0.1, 0.2}, {0.3, 0.4}});
    doc["modalDisp2Outputs"] = SourceDocument::array({{1.0, 2.0}, {3.0, 4.0}});
    doc["proportionalDampingVec"] = {0.02, 0.02, 0.02, 0.02};
    return doc;
}

/// The same model reduced to a static gain (no modal keys).
inline SourceDocument hierarchical_static_source() {
    SourceDocument doc = hierarchical_modal_source();
    doc.erase("eigenfrequencies");
    doc.erase("inputs2ModalF");
    doc.erase("modalDisp2Outputs");
    doc.erase("proportionalDampingVec");
    doc["gainMatrix"] = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    return doc;
}

/**
 * @brief Re-lay a hierarchical source as flat structured arrays.
 *
 * group[k][field] becomes group[field][k]; everything else is copied.
 */
inline SourceDocument to_flat_layout(const SourceDocument& hierarchical) {
    SourceDocument flat = hierarchical;
    for (const char* root : {"fem_inputs", "fem_outputs"}) {
        SourceDocument groups = SourceDocument::object();
        for (const auto& [name, channels] : hierarchical.at(root).items()) {
            SourceDocument record = SourceDocument::object();
            for (const auto& [field, value] : channels.at(0).items()) {
                record[field] = SourceDocument::array();
            }
            for (const auto& channel : channels) {
                for (const auto& [field, value] : channel.items()) {
                    record[field].push_back(value);
                }
            }
            groups[name] = std::move(record);
        }
        flat[root] = std::move(groups);
    }
    return flat;
}

inline void expect_conversion_error(const std::function<void()>& fn, ErrorKind expected) {
    try {
        fn();
        ADD_FAILURE() << "expected " << to_string(expected);
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.kind(), expected) << e.what();
    }
}

} // namespace FemCanon::testing
