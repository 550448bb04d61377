/**
 * @file test_specimen_index_contract.cpp
 * @brief Behaviour every SpecimenIndex implementation must show
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "core/errors/Errors.hpp"
#include "core/metadata/SqliteSpecimenIndex.hpp"
#include "TestSupport.hpp"

using namespace hbl;
using hbl::test::makeFields;

namespace {

struct SqliteIndexFactory {
  static std::unique_ptr<SpecimenIndex> open(const std::string& path) {
    return std::make_unique<SqliteSpecimenIndex>(path);
  }
};

AttemptKey keyFor(const SpecimenIdentity& id, const std::string& paramsHash, bool forced = false) {
  AttemptKey k;
  k.specimen    = id;
  k.provider    = "ocr-a";
  k.model       = "m1";
  k.params_hash = paramsHash;
  k.params_json = R"({"model":"m1"})";
  k.forced      = forced;
  return k;
}

AggregatedRecord recordWithCatalog(const SpecimenIdentity& id, const std::string& catalog) {
  AggregatedRecord r;
  r.specimen = id;
  r.fields[DwcField::CatalogNumber] = SelectedField{catalog, 0.9, "att", "ocr-a", 1};
  return r;
}

} // namespace

template <typename Factory>
class SpecimenIndexContract : public ::testing::Test {
protected:
  SpecimenIndexContract() : index(Factory::open(db.path())) {}

  std::unique_ptr<SpecimenIndex> second() { return Factory::open(db.path()); }

  test::TempDb                   db;
  std::unique_ptr<SpecimenIndex> index;
  const SpecimenIdentity         a = test::fakeIdentity('a');
  const SpecimenIdentity         b = test::fakeIdentity('b');
  const SpecimenIdentity         c = test::fakeIdentity('c');
};

using IndexImplementations = ::testing::Types<SqliteIndexFactory>;
TYPED_TEST_SUITE(SpecimenIndexContract, IndexImplementations);

TYPED_TEST(SpecimenIndexContract, RegisterIsIdempotentAndKeepsEverySource) {
  EXPECT_TRUE(this->index->registerSpecimen(this->a, "/scans/2019/DAO-1.jpg"));
  EXPECT_FALSE(this->index->registerSpecimen(this->a, "/mirror/dao_1.jpg"));
  EXPECT_FALSE(this->index->registerSpecimen(this->a, "/scans/2019/DAO-1.jpg"));

  ASSERT_TRUE(this->index->specimen(this->a));
  EXPECT_EQ(this->index->specimen(this->a)->identity, this->a);
  EXPECT_FALSE(this->index->specimen(this->b));
  EXPECT_EQ(this->index->sources(this->a).size(), 2u);
  EXPECT_THROW(this->index->registerSpecimen("", "x"), ConfigurationError);
}

TYPED_TEST(SpecimenIndexContract, ShouldExtractOnlyUntilCompleted) {
  auto& idx = *this->index;
  idx.registerSpecimen("abc123", "");

  auto first = idx.shouldExtract("abc123", "v1", false);
  EXPECT_TRUE(first.extract);
  EXPECT_FALSE(first.existing_attempt);

  const std::string id = idx.recordAttempt(keyFor("abc123", "v1"), AttemptStatus::Complete,
                                           test::makeResult({{"catalogNumber", "1073", 0.9}}));

  auto second = idx.shouldExtract("abc123", "v1", false);
  EXPECT_FALSE(second.extract);
  EXPECT_EQ(second.existing_attempt.value_or(""), id);

  auto forced = idx.shouldExtract("abc123", "v1", true);
  EXPECT_TRUE(forced.extract);
  EXPECT_EQ(forced.existing_attempt.value_or(""), id);

  // Other params are a different key.
  EXPECT_TRUE(idx.shouldExtract("abc123", "v2", false).extract);
}

TYPED_TEST(SpecimenIndexContract, FailedAttemptDoesNotBlockRetry) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string id = idx.beginAttempt(keyFor(this->a, "p1"));
  idx.failAttempt(id, {"transient: 429 rate limited"}, FieldSet{});

  auto d = idx.shouldExtract(this->a, "p1", false);
  EXPECT_TRUE(d.extract);
  EXPECT_EQ(d.existing_attempt.value_or(""), id);

  auto stored = idx.attempt(id);
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->status, AttemptStatus::Failed);
  ASSERT_EQ(stored->errors.size(), 1u);
  EXPECT_EQ(stored->errors[0], "transient: 429 rate limited");
  EXPECT_GT(stored->finished_at, 0);
}

TYPED_TEST(SpecimenIndexContract, PendingAttemptRoundTrip) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string id = idx.beginAttempt(keyFor(this->a, "p1"));

  auto pending = idx.attempt(id);
  ASSERT_TRUE(pending);
  EXPECT_EQ(pending->status, AttemptStatus::Pending);
  EXPECT_EQ(pending->finished_at, 0);
  EXPECT_EQ(pending->provider, "ocr-a");
  EXPECT_EQ(pending->model, "m1");
  EXPECT_EQ(pending->params_json, R"({"model":"m1"})");

  idx.completeAttempt(id, makeFields({{"scientificName", "Carex aquatilis", 0.8}, {"stampText", "DAO", 0.2}}));
  auto done = idx.attempt(id);
  ASSERT_TRUE(done);
  EXPECT_EQ(done->status, AttemptStatus::Complete);
  ASSERT_TRUE(done->fields.get("scientificName"));
  EXPECT_EQ(done->fields.get("scientificName")->value, "Carex aquatilis");
  EXPECT_DOUBLE_EQ(done->fields.get("scientificName")->confidence, 0.8);
  ASSERT_TRUE(done->fields.get("stampText"));
}

TYPED_TEST(SpecimenIndexContract, TerminalAttemptsAreImmutable) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string done = idx.beginAttempt(keyFor(this->a, "p1"));
  idx.completeAttempt(done, makeFields({{"country", "Canada", 0.9}}));
  EXPECT_THROW(idx.completeAttempt(done, makeFields({{"country", "USA", 0.9}})), IntegrityViolation);
  EXPECT_THROW(idx.failAttempt(done, {"late failure"}, FieldSet{}), IntegrityViolation);

  const std::string failed = idx.beginAttempt(keyFor(this->a, "p2"));
  idx.failAttempt(failed, {"boom"}, FieldSet{});
  EXPECT_THROW(idx.completeAttempt(failed, makeFields({{"country", "Canada", 0.9}})), IntegrityViolation);

  EXPECT_EQ(idx.attempt(done)->fields.get("country")->value, "Canada");
}

TYPED_TEST(SpecimenIndexContract, UnknownAttemptIdIsStorageError) {
  EXPECT_THROW(this->index->completeAttempt("no-such-id", FieldSet{}), StorageError);
  EXPECT_FALSE(this->index->attempt("no-such-id"));
}

TYPED_TEST(SpecimenIndexContract, AttemptForUnknownSpecimenIsRejected) {
  EXPECT_THROW(this->index->beginAttempt(keyFor(this->c, "p1")), StorageError);
}

TYPED_TEST(SpecimenIndexContract, OneCanonicalCompletionPerKey) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string first  = idx.beginAttempt(keyFor(this->a, "p1"));
  const std::string second = idx.beginAttempt(keyFor(this->a, "p1"));

  idx.completeAttempt(first, makeFields({{"country", "Canada", 0.9}}));
  EXPECT_THROW(idx.completeAttempt(second, makeFields({{"country", "Canada", 0.8}})), IntegrityViolation);

  // The loser can still be closed as failed.
  idx.failAttempt(second, {"duplicate of canonical attempt " + first}, FieldSet{});
  EXPECT_EQ(idx.attempt(second)->status, AttemptStatus::Failed);

  EXPECT_THROW(idx.recordAttempt(keyFor(this->a, "p1"), AttemptStatus::Complete,
                                 test::makeResult({{"country", "Canada", 0.9}})),
               IntegrityViolation);
}

TYPED_TEST(SpecimenIndexContract, ForcedCompletionCoexistsWithCanonical) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string canonical = idx.recordAttempt(keyFor(this->a, "p1"), AttemptStatus::Complete,
                                                  test::makeResult({{"country", "Canada", 0.9}}));
  const std::string forced = idx.recordAttempt(keyFor(this->a, "p1", true), AttemptStatus::Complete,
                                               test::makeResult({{"country", "Canada", 0.7}}));
  EXPECT_NE(canonical, forced);
  EXPECT_TRUE(idx.attempt(forced)->forced);
  EXPECT_EQ(idx.shouldExtract(this->a, "p1", false).existing_attempt.value_or(""), canonical);
  EXPECT_EQ(idx.attempts(this->a).size(), 2u);
}

TYPED_TEST(SpecimenIndexContract, ConcurrentCompletionFromTwoConnections) {
  auto other = this->second();
  this->index->registerSpecimen(this->a, "");

  const std::string mine   = this->index->beginAttempt(keyFor(this->a, "p1"));
  const std::string theirs = other->beginAttempt(keyFor(this->a, "p1"));

  other->completeAttempt(theirs, makeFields({{"country", "Canada", 0.9}}));
  EXPECT_THROW(this->index->completeAttempt(mine, makeFields({{"country", "Canada", 0.9}})),
               IntegrityViolation);

  int canonical = 0;
  for (const auto& at : this->index->attempts(this->a)) {
    if (at.status == AttemptStatus::Complete && !at.forced) ++canonical;
  }
  EXPECT_EQ(canonical, 1);
}

TYPED_TEST(SpecimenIndexContract, FailedAttemptKeepsPartialPayload) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  const std::string id = idx.recordAttempt(
    keyFor(this->a, "p1"), AttemptStatus::Failed,
    EngineResult{makeFields({{"catalogNumber", "AAFC-1", 0.4}}), {"truncated response"}});
  auto stored = idx.attempt(id);
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->status, AttemptStatus::Failed);
  ASSERT_TRUE(stored->fields.get("catalogNumber"));
  EXPECT_EQ(stored->fields.get("catalogNumber")->value, "AAFC-1");
}

TYPED_TEST(SpecimenIndexContract, TransformationsResolveToTheirSpecimen) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  idx.registerSpecimen(this->b, "");

  Transformation crop;
  crop.image_hash   = test::fakeIdentity('d');
  crop.specimen     = this->a;
  crop.derived_from = this->a;
  crop.operation    = "crop_label";
  crop.params_json  = R"({"box":[10,10,400,300]})";
  crop.tool         = "opencv";
  crop.tool_version = "4.9";
  idx.registerTransformation(crop);
  idx.registerTransformation(crop);  // same derivation again

  Transformation gray = crop;
  gray.image_hash   = test::fakeIdentity('e');
  gray.derived_from = crop.image_hash;
  gray.operation    = "grayscale";
  idx.registerTransformation(gray);

  EXPECT_EQ(idx.transformations(this->a).size(), 2u);
  EXPECT_EQ(idx.resolveIdentity(gray.image_hash).value_or(""), this->a);
  EXPECT_EQ(idx.resolveIdentity(this->a).value_or(""), this->a);
  EXPECT_FALSE(idx.resolveIdentity(this->c));

  Transformation stolen = crop;
  stolen.specimen = this->b;
  EXPECT_THROW(idx.registerTransformation(stolen), IntegrityViolation);
}

TYPED_TEST(SpecimenIndexContract, CatalogNumberSnapshotIsNormalized) {
  auto& idx = *this->index;
  for (const auto& id : {this->a, this->b, this->c}) idx.registerSpecimen(id, "");
  idx.saveAggregation(recordWithCatalog(this->a, "AAFC-1073"));
  idx.saveAggregation(recordWithCatalog(this->b, " aafc-1073"));
  idx.saveAggregation(recordWithCatalog(this->c, "AAFC-2000"));

  EXPECT_EQ(idx.catalogNumberOf(this->a).value_or(""), "aafc-1073");
  auto holders = idx.queryByCatalogNumber("AAFC-1073 ");
  ASSERT_EQ(holders.size(), 2u);
  EXPECT_EQ(holders[0], this->a);
  EXPECT_EQ(holders[1], this->b);

  auto dups = idx.listDuplicates();
  ASSERT_EQ(dups.size(), 1u);
  EXPECT_EQ(dups[0].first, "aafc-1073");
  EXPECT_EQ(dups[0].second.size(), 2u);

  // Overwrite: the snapshot follows the latest aggregation.
  idx.saveAggregation(recordWithCatalog(this->b, "AAFC-2000"));
  EXPECT_EQ(idx.queryByCatalogNumber("AAFC-1073").size(), 1u);
  AggregatedRecord empty;
  empty.specimen = this->c;
  idx.saveAggregation(empty);
  EXPECT_FALSE(idx.catalogNumberOf(this->c));
}

TYPED_TEST(SpecimenIndexContract, ReplaceFlagsKeepsResolvedOnes) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");

  QualityFlag missing;
  missing.specimen = this->a;
  missing.kind     = flag_kind::MissingCoreField;
  missing.severity = Severity::High;
  missing.field    = "scientificName";
  missing.detail   = "scientificName is missing";
  QualityFlag unmapped = missing;
  unmapped.kind     = flag_kind::UnmappedField;
  unmapped.severity = Severity::Low;
  unmapped.field    = "stampText";
  unmapped.detail   = "provider key 'stampText' is not a registered term";

  idx.replaceFlags(this->a, {missing, unmapped});
  auto raised = idx.flags(this->a, true);
  ASSERT_EQ(raised.size(), 2u);

  int64_t unmappedId = 0;
  for (const auto& f : raised) {
    if (f.kind == flag_kind::UnmappedField) unmappedId = f.id;
  }
  ASSERT_NE(unmappedId, 0);
  EXPECT_TRUE(idx.resolveFlag(unmappedId));
  EXPECT_FALSE(idx.resolveFlag(unmappedId));

  // Recompute raises the same two; the resolved one stays resolved.
  idx.replaceFlags(this->a, {missing, unmapped});
  EXPECT_EQ(idx.flags(this->a, true).size(), 1u);
  EXPECT_EQ(idx.flags(this->a, false).size(), 2u);

  idx.replaceFlags(this->a, {});
  EXPECT_TRUE(idx.flags(this->a, true).empty());
  EXPECT_EQ(idx.flags(this->a, false).size(), 1u);
}

TYPED_TEST(SpecimenIndexContract, UnchangedFlagsKeepTheirIds) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");

  QualityFlag missing;
  missing.specimen = this->a;
  missing.kind     = flag_kind::MissingCoreField;
  missing.severity = Severity::High;
  missing.field    = "catalogNumber";
  missing.detail   = "catalogNumber is missing";
  QualityFlag date = missing;
  date.kind     = flag_kind::ImplausibleDate;
  date.severity = Severity::Medium;
  date.field    = "eventDate";
  date.detail   = "eventDate year 1723 outside 1800..2024";

  idx.replaceFlags(this->a, {missing, date});
  auto before = idx.flags(this->a, true);
  ASSERT_EQ(before.size(), 2u);

  // The date flag goes away and a new one appears; the missing one is untouched.
  QualityFlag unmapped = missing;
  unmapped.kind     = flag_kind::UnmappedField;
  unmapped.severity = Severity::Low;
  unmapped.field    = "stampText";
  unmapped.detail   = "provider key 'stampText' is not a registered term";
  idx.replaceFlags(this->a, {missing, unmapped, missing});

  auto after = idx.flags(this->a, true);
  ASSERT_EQ(after.size(), 2u);
  EXPECT_EQ(after[0].kind, flag_kind::MissingCoreField);
  EXPECT_EQ(after[0].id, before[0].id);
  EXPECT_EQ(after[0].created_at, before[0].created_at);
  EXPECT_EQ(after[1].kind, flag_kind::UnmappedField);
  EXPECT_GT(after[1].id, before[1].id);
  EXPECT_TRUE(idx.resolveFlag(before[0].id));
}

TYPED_TEST(SpecimenIndexContract, ReviewReferenceIsUpserted) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "");
  EXPECT_FALSE(idx.review(this->a));

  idx.attachReview(ReviewReference{this->a, "review-db:4411", "pending", 0});
  idx.attachReview(ReviewReference{this->a, "review-db:4412", "approved", 0});
  auto r = idx.review(this->a);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->decision_ref, "review-db:4412");
  EXPECT_EQ(r->status, "approved");
  EXPECT_GT(r->recorded_at, 0);

  EXPECT_THROW(idx.attachReview(ReviewReference{this->a, "", "approved", 0}), ConfigurationError);
}

TYPED_TEST(SpecimenIndexContract, ListSpecimensPagesAndFilters) {
  auto& idx = *this->index;
  for (char ch : std::string("12345")) idx.registerSpecimen(test::fakeIdentity(ch), "");
  idx.attachReview(ReviewReference{test::fakeIdentity('2'), "r-2", "approved", 0});
  idx.attachReview(ReviewReference{test::fakeIdentity('4'), "r-4", "approved", 0});
  idx.saveAggregation(recordWithCatalog(test::fakeIdentity('3'), "AAFC-55555"));

  SpecimenFilter f;
  f.limit = 2;
  auto p1 = idx.listSpecimens(f);
  ASSERT_EQ(p1.items.size(), 2u);
  EXPECT_EQ(p1.items[0].identity, test::fakeIdentity('1'));
  EXPECT_EQ(p1.next_cursor, test::fakeIdentity('2'));

  f.after = p1.next_cursor;
  auto p2 = idx.listSpecimens(f);
  ASSERT_EQ(p2.items.size(), 2u);
  EXPECT_EQ(p2.items[0].identity, test::fakeIdentity('3'));
  EXPECT_EQ(p2.items[0].catalog_number.value_or(""), "AAFC-55555");

  f.after = p2.next_cursor;
  auto p3 = idx.listSpecimens(f);
  ASSERT_EQ(p3.items.size(), 1u);
  EXPECT_TRUE(p3.next_cursor.empty());

  SpecimenFilter approved;
  approved.review_status = "approved";
  auto ap = idx.listSpecimens(approved);
  ASSERT_EQ(ap.items.size(), 2u);
  EXPECT_EQ(ap.items[1].review_status.value_or(""), "approved");

  SpecimenFilter byCatalog;
  byCatalog.catalog_number = "aafc-55555";
  EXPECT_EQ(idx.listSpecimens(byCatalog).items.size(), 1u);
}

TYPED_TEST(SpecimenIndexContract, StatsCountEverything) {
  auto& idx = *this->index;
  idx.registerSpecimen(this->a, "one.jpg");
  idx.registerSpecimen(this->a, "two.jpg");
  idx.beginAttempt(keyFor(this->a, "p0"));
  idx.recordAttempt(keyFor(this->a, "p1"), AttemptStatus::Complete, test::makeResult({{"country", "Canada", 0.5}}));
  idx.recordAttempt(keyFor(this->a, "p2"), AttemptStatus::Failed, EngineResult{{}, {"x"}});

  IndexStats s = idx.stats();
  EXPECT_EQ(s.specimens, 1);
  EXPECT_EQ(s.sources, 2);
  EXPECT_EQ(s.attempts_pending, 1);
  EXPECT_EQ(s.attempts_complete, 1);
  EXPECT_EQ(s.attempts_failed, 1);
  EXPECT_EQ(s.reviews, 0);
}
