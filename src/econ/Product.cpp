#include "farmstock/econ/Product.h"

#include <cctype>

namespace farmstock::econ {

static const std::vector<ProductDef> kTable = {
  {"WHEAT",      "Wheat",       "Trigo",          740.0},
  {"BARLEY",     "Barley",      "Cebada",         680.0},
  {"OAT",        "Oat",         "Avena",         1050.0},
  {"CANOLA",     "Canola",      "Colza",         1480.0},
  {"SORGHUM",    "Sorghum",     "Sorgo",          760.0},
  {"SUNFLOWER",  "Sunflowers",  "Girasol",       1330.0},
  {"SOYBEAN",    "Soybeans",    "Soja",          1570.0},
  {"MAIZE",      "Corn",        "Maiz",           690.0},
  {"POTATO",     "Potatoes",    "Patatas",        420.0},
  {"SUGARBEET",  "Sugar Beet",  "Remolacha",      290.0},
  {"SUGARCANE",  "Sugarcane",   "Cana de azucar", 230.0},
  {"COTTON",     "Cotton",      "Algodon",       2200.0},
  {"GRAPE",      "Grapes",      "Uvas",          1950.0},
  {"OLIVE",      "Olives",      "Aceitunas",     1800.0},
  {"MILK",       "Milk",        "Leche",         1400.0},
  {"WOOL",       "Wool",        "Lana",          2400.0},
  {"EGG",        "Eggs",        "Huevos",        2300.0},
  {"SILAGE",     "Silage",      "Ensilado",       250.0},
  {"STRAW",      "Straw",       "Paja",           200.0},
  {"WOODCHIPS",  "Wood Chips",  "Astillas",       180.0},
};

const std::vector<ProductDef>& productTable() { return kTable; }

static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::toupper((unsigned char)a[i]) != std::toupper((unsigned char)b[i])) return false;
  }
  return true;
}

const ProductDef* findProduct(std::string_view id) {
  for (const ProductDef& p : kTable) {
    if (equalsIgnoreCase(p.id, id)) return &p;
  }
  return nullptr;
}

std::string_view productDisplayName(std::string_view id, Language lang) {
  const ProductDef* p = findProduct(id);
  if (!p) return id;
  return (lang == Language::Spanish) ? p->nameEs : p->nameEn;
}

bool tryParseLanguage(std::string_view code, Language& out) {
  if (equalsIgnoreCase(code, "en")) { out = Language::English; return true; }
  if (equalsIgnoreCase(code, "es")) { out = Language::Spanish; return true; }
  return false;
}

} // namespace farmstock::econ
