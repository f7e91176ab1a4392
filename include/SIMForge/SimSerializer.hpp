#pragma once
// SimSerializer.hpp – XML and JSON forms of the Semantic Intermediate Model
// and the validation report.
//
// SIM layout:
//
//   <sim standard="MIL-STD-6016" edition="C" transport_unit="bit" page_count="812">
//     <messages>
//       <message label="J3.2" title="Air Track" edition="C" first_page="14">
//         <segments>
//           <segment type="initial" index="0" bit_length="70" declared="true">
//             <fields>
//               <field name="Altitude" start="0" end="15" encoding="integer"
//                      units="foot" unit_resolved="true" confidence="0.92"
//                      nullable="false" page="14" row="3">
//                 <description>Current altitude</description>
//               </field>
//   ...
//     <dictionary><entry key="DFI-281" parent="" level="category" .../></dictionary>
//     <enums><enum key="J3.2.Identity"><value code="0" label="Pending"/></enum></enums>
//     <units><unit symbol="foot" base_si="metre" factor="0.3048" offset="0" .../></units>
//   </sim>
//
// Attribute and element names are a stable contract for downstream tools.
//
// The JSON form uses the same names as object keys; each element list becomes
// an array under its container name and absent optional values are omitted:
//
//   { "standard": "MIL-STD-6016", "edition": "C", "transport_unit": "bit",
//     "page_count": 812,
//     "messages": [ { "label": "J3.2", ..., "segments": [ { "type": "initial",
//         ..., "fields": [ { "name": "Altitude", "start": 0, "end": 15, ... } ] } ] } ],
//     "dictionary": [ ... ], "enums": [ { "key": ..., "values": [ ... ] } ],
//     "units": [ { "symbol": "foot", ..., "aliases": [ "feet", "ft" ] } ] }

#include "Pipeline.hpp"
#include "Types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace simforge {

// Thrown when serialized input violates the SIM layout.
class SimFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string   toXml(const SemanticModel& model);
[[nodiscard]] SemanticModel fromXml(std::string_view xml);

[[nodiscard]] std::string   toJson(const SemanticModel& model);
[[nodiscard]] SemanticModel fromJson(std::string_view json);

// File variants; the caller owns the path. A ".json" extension selects the
// JSON form, anything else XML.
void                        saveSim(const SemanticModel& model, const std::filesystem::path& path);
[[nodiscard]] SemanticModel loadSim(const std::filesystem::path& path);

// <report errors=".." warnings=".." info=".."><issue .../></report>
[[nodiscard]] std::string reportToXml(const std::vector<ValidationIssue>& issues);

// Human-readable report: issues grouped by severity, then the coverage and
// confidence summary.
[[nodiscard]] std::string formatReport(const std::vector<ValidationIssue>& issues,
                                       const Diagnostics& diagnostics);

} // namespace simforge
