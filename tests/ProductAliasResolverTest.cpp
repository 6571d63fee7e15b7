#include <gtest/gtest.h>

#include "ProductAliasResolver.h"
#include "KardexTestData.h"

class ProductAliasResolverTest : public ::testing::Test {
protected:
    ProductAliasResolver resolver{KardexConfig::defaults()};
};

TEST_F(ProductAliasResolverTest, ConfiguredName_ShouldResolveIgnoringAccentsCaseAndPunctuation) {
    EXPECT_EQ(resolver.resolveText("Café Conilon Beneficiado"), ProductAlias::RawMaterial);
    EXPECT_EQ(resolver.resolveText("cafe rancho 10x500g"), ProductAlias::FinishedA);
    EXPECT_EQ(resolver.resolveText("CAFÉ  RANCHO  20X250G"), ProductAlias::FinishedB);
    EXPECT_EQ(resolver.resolveText("Café Nova-Era 10x500g"), ProductAlias::FinishedC);
}

TEST_F(ProductAliasResolverTest, QualifierAndNeedle_ShouldResolveRawMaterialHeuristically) {
    // Given a description that is not in the name table
    const QString text = "CAFE CONILON BENEFICIADO PENEIRA 13 SAFRA 2024";

    // Then qualifier + needle classify it as raw material
    EXPECT_EQ(resolver.resolveText(text), ProductAlias::RawMaterial);
}

TEST_F(ProductAliasResolverTest, NeedleWithoutQualifier_ShouldNotResolve) {
    EXPECT_FALSE(resolver.resolveText("CAFE CONILON EM COCO").has_value());
    EXPECT_FALSE(resolver.resolveText("ACUCAR CRISTAL 5KG").has_value());
    EXPECT_FALSE(resolver.resolveText("").has_value());
}

TEST_F(ProductAliasResolverTest, Resolve_ShouldPreferMappedProductOverLineDescription) {
    InvoiceItemRecord item;
    item.mappedProductName = "CAFE RANCHO 20X250G";
    item.description = "CAFE CONILON BENEFICIADO";

    EXPECT_EQ(resolver.resolve(item), ProductAlias::FinishedB);
}

TEST_F(ProductAliasResolverTest, Resolve_ShouldFallBackToDescriptionAndCode) {
    InvoiceItemRecord item;
    item.mappedProductName = "PRODUTO GENERICO";
    item.description = "ITEM 44";
    item.productCode = "RANCHO 10X500";

    EXPECT_EQ(resolver.resolve(item), ProductAlias::FinishedA);
}

TEST_F(ProductAliasResolverTest, CustomNameTable_ShouldBeHonoured) {
    KardexConfig config = KardexConfig::defaults();
    config.productNames[ProductAlias::FinishedC] = { "BLEND ESPECIAL 1KG" };
    const ProductAliasResolver custom(config);

    EXPECT_EQ(custom.resolveText("Blend Especial 1kg"), ProductAlias::FinishedC);
    EXPECT_FALSE(custom.resolveText("CAFE NOVA ERA 10X500G").has_value());
}
