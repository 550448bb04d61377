#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hbl {

// Darwin Core terms the engine knows about. Anything else a provider emits
// lands in FieldSet::extra.
enum class DwcField {
  OccurrenceID,
  CatalogNumber,
  OtherCatalogNumbers,
  InstitutionCode,
  CollectionCode,
  OwnerInstitutionCode,
  BasisOfRecord,
  Preparations,
  Disposition,
  RecordedBy,
  RecordedByID,
  RecordNumber,
  EventDate,
  EventTime,
  VerbatimEventDate,
  Country,
  StateProvince,
  County,
  Municipality,
  Locality,
  VerbatimLocality,
  DecimalLatitude,
  DecimalLongitude,
  GeodeticDatum,
  CoordinateUncertaintyInMeters,
  Habitat,
  EventRemarks,
  ScientificName,
  ScientificNameAuthorship,
  TaxonRank,
  Family,
  Genus,
  SpecificEpithet,
  InfraspecificEpithet,
  IdentificationQualifier,
  IdentifiedBy,
  DateIdentified,
  IdentificationRemarks,
  OccurrenceRemarks,
  VerbatimLabel,
};

const char* fieldName(DwcField f);
std::optional<DwcField> parseField(std::string_view name);
const std::vector<DwcField>& allFields();

struct FieldValue {
  std::string value;
  double      confidence = 0.0;
};

struct FieldSet {
  std::map<DwcField, FieldValue>    known;
  std::map<std::string, FieldValue> extra;

  // Routes a provider key to the known schema or the extra bucket.
  void set(const std::string& name, FieldValue v);
  std::optional<FieldValue> get(const std::string& name) const;
  bool empty() const { return known.empty() && extra.empty(); }
  size_t size() const { return known.size() + extra.size(); }
};

// Leading/trailing whitespace removed.
std::string trimCopy(std::string_view s);
// Comparison key: trimmed and ASCII case-folded. Never stored as a value.
std::string normalizeValue(std::string_view s);

} // namespace hbl
