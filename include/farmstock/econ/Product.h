#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace farmstock::econ {

enum class Language {
  English = 0,
  Spanish = 1
};

// Built-in product catalog entry.
struct ProductDef {
  const char* id{};        // stable id used by stock entries and stock files
  const char* nameEn{};
  const char* nameEs{};
  double defaultPricePerThousand{}; // typical top selling price per 1000 L
};

const std::vector<ProductDef>& productTable();

// Case-insensitive id lookup. Returns nullptr for products outside the catalog
// (custom products are allowed in stock; they just have no display name).
const ProductDef* findProduct(std::string_view id);

// Localized display name, or the raw id when the product is not in the catalog.
std::string_view productDisplayName(std::string_view id, Language lang);

// "en" / "es" (case-insensitive). Returns false for anything else.
bool tryParseLanguage(std::string_view code, Language& out);

} // namespace farmstock::econ
