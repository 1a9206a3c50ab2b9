// =============================================================================
// bom_test.cpp
// =============================================================================
// Tests for BOM explosion and the BOM registry.
//
// Validates:
//   1. Explosion arithmetic including scrap allowance
//   2. Explosion preconditions (positive target, ACTIVE, has lines)
//   3. Registry validation and per-type code numbering
//   4. Status transition table
//   5. Listing, where-used and usage summary ordering
// =============================================================================

#include "engine_fixture.hpp"

#include "mfg/bom/bom_explosion.hpp"
#include "mfg/bom/bom_registry.hpp"
#include "mfg/errors/errors.hpp"

#include <gtest/gtest.h>

using namespace mfg_test;
using mfg::domain::BomStatus;
using mfg::domain::BomType;

namespace {

mfg::domain::BomHeader activeHeader(std::vector<mfg::domain::BomLine> lines) {
  mfg::domain::BomHeader bom;
  bom.code = "BOM-KIT-001";
  bom.status = BomStatus::Active;
  bom.lines = std::move(lines);
  return bom;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Explosion arithmetic
// -----------------------------------------------------------------------------
TEST(BomExplosionTest, AppliesScrapAllowance) {
  auto bom = activeHeader({line(kMaterialA, 2.0, 5.0), line(kBox, 1.0)});
  bom.lines[1].material_type = mfg::domain::MaterialType::Packaging;
  bom.lines[1].uom = "PCS";

  const auto reqs = mfg::BomExplosionCalculator::explode(bom, 10.0, {});

  ASSERT_EQ(reqs.size(), 2u);
  EXPECT_EQ(reqs[0].material_id, kMaterialA);
  EXPECT_NEAR(reqs[0].required_qty, 21.0, 1e-9);
  EXPECT_EQ(reqs[1].material_id, kBox);
  EXPECT_NEAR(reqs[1].required_qty, 10.0, 1e-9);
  EXPECT_EQ(reqs[1].uom, "PCS");
  EXPECT_EQ(reqs[1].material_type, mfg::domain::MaterialType::Packaging);
}

// -----------------------------------------------------------------------------
// 2. Explosion preconditions
// -----------------------------------------------------------------------------
TEST(BomExplosionTest, RejectsNonPositiveTarget) {
  const auto bom = activeHeader({line(kMaterialA, 1.0)});
  EXPECT_THROW(mfg::BomExplosionCalculator::explode(bom, 0.0, {}),
               mfg::ValidationError);
  EXPECT_THROW(mfg::BomExplosionCalculator::explode(bom, -3.0, {}),
               mfg::ValidationError);
}

TEST(BomExplosionTest, RequiresActiveBomUnlessPolicyRelaxed) {
  auto bom = activeHeader({line(kMaterialA, 1.0)});
  bom.status = BomStatus::Draft;

  EXPECT_THROW(mfg::BomExplosionCalculator::explode(bom, 1.0, {}),
               mfg::NotFoundError);

  mfg::ExplosionPolicy relaxed;
  relaxed.require_active = false;
  EXPECT_EQ(mfg::BomExplosionCalculator::explode(bom, 1.0, relaxed).size(),
            1u);
}

TEST(BomExplosionTest, BomWithoutLinesIsNotFound) {
  EXPECT_THROW(mfg::BomExplosionCalculator::explode(activeHeader({}), 1.0, {}),
               mfg::NotFoundError);
}

// -----------------------------------------------------------------------------
// 3. Registry validation and numbering
// -----------------------------------------------------------------------------
class BomRegistryTest : public EngineFixture {
 protected:
  mfg::BomDraft draft(BomType type, std::vector<mfg::domain::BomLine> lines) {
    mfg::BomDraft d;
    d.name = "Draft BOM";
    d.type = type;
    d.output_product_id = kKit;
    d.lines = std::move(lines);
    return d;
  }

  mfg::BomRegistry& boms() { return engine->boms(); }
};

TEST_F(BomRegistryTest, CreatesDraftWithPerTypeCodes) {
  const auto kit1 =
      boms().createBom(draft(BomType::Kitting, {line(kMaterialA, 1)}), "eng");
  const auto cut1 =
      boms().createBom(draft(BomType::Cutting, {line(kMaterialA, 1)}), "eng");
  const auto kit2 =
      boms().createBom(draft(BomType::Kitting, {line(kMaterialB, 1)}), "eng");
  const auto rep1 =
      boms().createBom(draft(BomType::Repacking, {line(kBox, 1)}), "eng");

  EXPECT_EQ(kit1.code, "BOM-KIT-001");
  EXPECT_EQ(cut1.code, "BOM-CUT-001");
  EXPECT_EQ(kit2.code, "BOM-KIT-002");
  EXPECT_EQ(rep1.code, "BOM-REP-001");

  EXPECT_EQ(kit1.status, BomStatus::Draft);
  EXPECT_EQ(kit1.version, 1);
  EXPECT_EQ(kit1.created_by, "eng");
  EXPECT_EQ(kit1.uom, "PCS");
  EXPECT_EQ(kit1.lines[0].uom, "KG");
}

TEST_F(BomRegistryTest, RejectsInvalidDrafts) {
  auto unnamed = draft(BomType::Kitting, {line(kMaterialA, 1)});
  unnamed.name.clear();
  EXPECT_THROW(boms().createBom(unnamed, "eng"), mfg::ValidationError);

  auto zero_output = draft(BomType::Kitting, {line(kMaterialA, 1)});
  zero_output.output_qty = 0.0;
  EXPECT_THROW(boms().createBom(zero_output, "eng"), mfg::ValidationError);

  auto unknown_output = draft(BomType::Kitting, {line(kMaterialA, 1)});
  unknown_output.output_product_id = 999;
  EXPECT_THROW(boms().createBom(unknown_output, "eng"), mfg::NotFoundError);

  auto service_output = draft(BomType::Kitting, {line(kMaterialA, 1)});
  service_output.output_product_id = kService;
  EXPECT_THROW(boms().createBom(service_output, "eng"), mfg::ValidationError);

  EXPECT_THROW(boms().createBom(draft(BomType::Kitting, {line(0, 1)}), "eng"),
               mfg::ValidationError);
  EXPECT_THROW(boms().createBom(draft(BomType::Kitting, {line(999, 1)}), "eng"),
               mfg::NotFoundError);
  EXPECT_THROW(
      boms().createBom(draft(BomType::Kitting, {line(kMaterialA, 0)}), "eng"),
      mfg::ValidationError);
  EXPECT_THROW(
      boms().createBom(
          draft(BomType::Kitting, {line(kMaterialA, 1, 100.0)}), "eng"),
      mfg::ValidationError);
  EXPECT_THROW(
      boms().createBom(
          draft(BomType::Kitting, {line(kMaterialA, 1, -1.0)}), "eng"),
      mfg::ValidationError);

  EXPECT_TRUE(boms().list().empty());
}

// -----------------------------------------------------------------------------
// 4. Status transitions
// -----------------------------------------------------------------------------
TEST(BomStatusTableTest, AllowedTransitions) {
  using R = mfg::BomRegistry;
  EXPECT_TRUE(R::canTransition(BomStatus::Draft, BomStatus::Active));
  EXPECT_TRUE(R::canTransition(BomStatus::Draft, BomStatus::Inactive));
  EXPECT_TRUE(R::canTransition(BomStatus::Active, BomStatus::Inactive));
  EXPECT_TRUE(R::canTransition(BomStatus::Inactive, BomStatus::Active));

  EXPECT_FALSE(R::canTransition(BomStatus::Active, BomStatus::Draft));
  EXPECT_FALSE(R::canTransition(BomStatus::Inactive, BomStatus::Draft));
  EXPECT_FALSE(R::canTransition(BomStatus::Active, BomStatus::Active));
}

TEST_F(BomRegistryTest, StatusChangesFollowTable) {
  const auto bom =
      boms().createBom(draft(BomType::Kitting, {line(kMaterialA, 1)}), "eng");

  EXPECT_EQ(boms().updateStatus(bom.id, BomStatus::Active, "qa").status,
            BomStatus::Active);
  EXPECT_THROW(boms().updateStatus(bom.id, BomStatus::Draft, "qa"),
               mfg::InvalidStateTransitionError);
  EXPECT_EQ(boms().updateStatus(bom.id, BomStatus::Inactive, "qa").updated_by,
            "qa");
  EXPECT_EQ(boms().get(bom.id).status, BomStatus::Inactive);
  EXPECT_THROW(boms().updateStatus(999, BomStatus::Active, "qa"),
               mfg::NotFoundError);
}

TEST_F(BomRegistryTest, EmptyBomCannotBeActivated) {
  const auto bom = boms().createBom(draft(BomType::Cutting, {}), "eng");
  EXPECT_THROW(boms().updateStatus(bom.id, BomStatus::Active, "qa"),
               mfg::ValidationError);
  EXPECT_EQ(boms().get(bom.id).status, BomStatus::Draft);
}

// -----------------------------------------------------------------------------
// 5. Listing and usage
// -----------------------------------------------------------------------------
TEST_F(BomRegistryTest, ListIsNewestFirstAndFilters) {
  auto first = draft(BomType::Kitting, {line(kMaterialA, 1)});
  first.name = "Gift Kit";
  auto second = draft(BomType::Cutting, {line(kMaterialA, 1)});
  second.name = "Sheet Cut";
  const auto a = boms().createBom(first, "eng");
  const auto b = boms().createBom(second, "eng");
  boms().updateStatus(b.id, BomStatus::Active, "eng");

  const auto all = boms().list();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, b.id);
  EXPECT_EQ(all[1].id, a.id);

  mfg::BomFilter by_type;
  by_type.type = BomType::Kitting;
  ASSERT_EQ(boms().list(by_type).size(), 1u);
  EXPECT_EQ(boms().list(by_type)[0].id, a.id);

  mfg::BomFilter by_status;
  by_status.status = BomStatus::Active;
  ASSERT_EQ(boms().list(by_status).size(), 1u);
  EXPECT_EQ(boms().list(by_status)[0].id, b.id);

  mfg::BomFilter by_text;
  by_text.search = "Gift";
  ASSERT_EQ(boms().list(by_text).size(), 1u);
  by_text.search = "BOM-CUT";
  ASSERT_EQ(boms().list(by_text).size(), 1u);
  by_text.search = "Kit";  // output product name matches both
  EXPECT_EQ(boms().list(by_text).size(), 2u);
}

TEST_F(BomRegistryTest, WhereUsedPutsActiveFirst) {
  auto draft_bom = draft(BomType::Kitting, {line(kMaterialA, 2)});
  draft_bom.name = "Alpha";
  boms().createBom(draft_bom, "eng");
  auto active_bom = draft(BomType::Kitting, {line(kMaterialA, 3)});
  active_bom.name = "Zulu";
  const auto z = boms().createBom(active_bom, "eng");
  boms().updateStatus(z.id, BomStatus::Active, "eng");

  const auto usages = boms().whereUsed(kMaterialA);

  ASSERT_EQ(usages.size(), 2u);
  EXPECT_EQ(usages[0].bom_name, "Zulu");
  EXPECT_EQ(usages[0].bom_status, BomStatus::Active);
  EXPECT_DOUBLE_EQ(usages[0].qty_per_unit, 3.0);
  EXPECT_EQ(usages[0].output_product_name, "Kit");
  EXPECT_EQ(usages[1].bom_name, "Alpha");
  EXPECT_TRUE(boms().whereUsed(kMaterialB).empty());
}

TEST_F(BomRegistryTest, UsageSummaryCountsActiveBomsOnly) {
  activeBom(BomType::Kitting, kKit, {line(kMaterialA, 2), line(kBox, 1)});
  activeBom(BomType::Cutting, kCutSheet, {line(kMaterialA, 0.5)});
  boms().createBom(draft(BomType::Kitting, {line(kMaterialB, 9)}), "eng");

  const auto rows = boms().materialUsageSummary();

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].material_id, kMaterialA);
  EXPECT_EQ(rows[0].usage_count, 2);
  EXPECT_DOUBLE_EQ(rows[0].total_qty_per_unit, 2.5);
  ASSERT_EQ(rows[0].bom_types.size(), 2u);
  EXPECT_EQ(rows[0].bom_types[0], BomType::Kitting);
  EXPECT_EQ(rows[0].bom_types[1], BomType::Cutting);
  EXPECT_EQ(rows[1].material_id, kBox);
  EXPECT_EQ(rows[1].usage_count, 1);
}
