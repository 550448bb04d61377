#include "core/model/Fields.hpp"

#include <cctype>
#include <utility>

namespace hbl {

namespace {

struct FieldEntry {
  DwcField    field;
  const char* name;
};

const FieldEntry kFields[] = {
  {DwcField::OccurrenceID, "occurrenceID"},
  {DwcField::CatalogNumber, "catalogNumber"},
  {DwcField::OtherCatalogNumbers, "otherCatalogNumbers"},
  {DwcField::InstitutionCode, "institutionCode"},
  {DwcField::CollectionCode, "collectionCode"},
  {DwcField::OwnerInstitutionCode, "ownerInstitutionCode"},
  {DwcField::BasisOfRecord, "basisOfRecord"},
  {DwcField::Preparations, "preparations"},
  {DwcField::Disposition, "disposition"},
  {DwcField::RecordedBy, "recordedBy"},
  {DwcField::RecordedByID, "recordedByID"},
  {DwcField::RecordNumber, "recordNumber"},
  {DwcField::EventDate, "eventDate"},
  {DwcField::EventTime, "eventTime"},
  {DwcField::VerbatimEventDate, "verbatimEventDate"},
  {DwcField::Country, "country"},
  {DwcField::StateProvince, "stateProvince"},
  {DwcField::County, "county"},
  {DwcField::Municipality, "municipality"},
  {DwcField::Locality, "locality"},
  {DwcField::VerbatimLocality, "verbatimLocality"},
  {DwcField::DecimalLatitude, "decimalLatitude"},
  {DwcField::DecimalLongitude, "decimalLongitude"},
  {DwcField::GeodeticDatum, "geodeticDatum"},
  {DwcField::CoordinateUncertaintyInMeters, "coordinateUncertaintyInMeters"},
  {DwcField::Habitat, "habitat"},
  {DwcField::EventRemarks, "eventRemarks"},
  {DwcField::ScientificName, "scientificName"},
  {DwcField::ScientificNameAuthorship, "scientificNameAuthorship"},
  {DwcField::TaxonRank, "taxonRank"},
  {DwcField::Family, "family"},
  {DwcField::Genus, "genus"},
  {DwcField::SpecificEpithet, "specificEpithet"},
  {DwcField::InfraspecificEpithet, "infraspecificEpithet"},
  {DwcField::IdentificationQualifier, "identificationQualifier"},
  {DwcField::IdentifiedBy, "identifiedBy"},
  {DwcField::DateIdentified, "dateIdentified"},
  {DwcField::IdentificationRemarks, "identificationRemarks"},
  {DwcField::OccurrenceRemarks, "occurrenceRemarks"},
  {DwcField::VerbatimLabel, "verbatimLabel"},
};

} // namespace

const char* fieldName(DwcField f) {
  for (const auto& e : kFields) {
    if (e.field == f) return e.name;
  }
  return "unknown";
}

std::optional<DwcField> parseField(std::string_view name) {
  for (const auto& e : kFields) {
    if (name == e.name) return e.field;
  }
  return std::nullopt;
}

const std::vector<DwcField>& allFields() {
  static const std::vector<DwcField> all = [] {
    std::vector<DwcField> v;
    for (const auto& e : kFields) v.push_back(e.field);
    return v;
  }();
  return all;
}

void FieldSet::set(const std::string& name, FieldValue v) {
  if (auto f = parseField(name)) {
    known[*f] = std::move(v);
  } else {
    extra[name] = std::move(v);
  }
}

std::optional<FieldValue> FieldSet::get(const std::string& name) const {
  if (auto f = parseField(name)) {
    auto it = known.find(*f);
    if (it != known.end()) return it->second;
    return std::nullopt;
  }
  auto it = extra.find(name);
  if (it != extra.end()) return it->second;
  return std::nullopt;
}

std::string trimCopy(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

std::string normalizeValue(std::string_view s) {
  std::string out = trimCopy(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace hbl
