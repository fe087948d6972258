#include "mapping/field_patterns.h"
#include <cctype>
#include <stdexcept>

namespace {

FieldPatternTable::PatternSource builtinSource() {
  FieldPatternTable::PatternSource source;

  source[FieldRole::TITLE] = {
      {"eng", {"^title$", "^name$", "^event.*name$", "^event.*title$", "^label$", "^event$"}},
      {"deu",
       {"^titel$", "^name$", "^bezeichnung$", "^veranstaltung.*name$",
        "^veranstaltung.*titel$", "^veranstaltung$"}},
      {"fra",
       {"^titre$", "^nom$", "^événement.*nom$", "^événement.*titre$", "^intitulé$",
        "^événement$"}},
      {"spa",
       {"^título$", "^nombre$", "^evento.*nombre$", "^evento.*título$",
        "^denominación$", "^evento$"}},
      {"ita",
       {"^titolo$", "^nome$", "^evento.*nome$", "^evento.*titolo$", "^denominazione$",
        "^evento$"}},
      {"nld",
       {"^titel$", "^naam$", "^evenement.*naam$", "^evenement.*titel$", "^benaming$",
        "^evenement$"}},
      {"por",
       {"^título$", "^nome$", "^evento.*nome$", "^evento.*título$", "^denominação$",
        "^evento$"}},
  };

  source[FieldRole::DESCRIPTION] = {
      {"eng",
       {"^description$", "^details$", "^summary$", "^notes$", "^text$", "^content$",
        "^event.*description$"}},
      {"deu",
       {"^beschreibung$", "^details$", "^zusammenfassung$", "^notizen$", "^text$",
        "^inhalt$", "^veranstaltung.*beschreibung$"}},
      {"fra",
       {"^description$", "^détails$", "^résumé$", "^notes$", "^texte$", "^contenu$",
        "^événement.*description$"}},
      {"spa",
       {"^descripción$", "^detalles$", "^resumen$", "^notas$", "^texto$",
        "^contenido$", "^evento.*descripción$"}},
      {"ita",
       {"^descrizione$", "^dettagli$", "^sommario$", "^note$", "^testo$",
        "^contenuto$", "^evento.*descrizione$"}},
      {"nld",
       {"^beschrijving$", "^details$", "^samenvatting$", "^notities$", "^tekst$",
        "^inhoud$", "^evenement.*beschrijving$"}},
      {"por",
       {"^descrição$", "^detalhes$", "^resumo$", "^notas$", "^texto$", "^conteúdo$",
        "^evento.*descrição$"}},
  };

  source[FieldRole::LOCATION_NAME] = {
      {"eng",
       {"^venue$", "^venue.*name$", "^place$", "^place.*name$", "^location$",
        "^location.*name$", "^site$", "^spot$", "^where$"}},
      {"deu",
       {"^veranstaltungsort$", "^ort$", "^spielstätte$", "^standort$", "^platz$",
        "^lokalität$", "^wo$"}},
      {"fra", {"^lieu$", "^endroit$", "^place$", "^salle$", "^site$", "^où$"}},
      {"spa",
       {"^lugar$", "^sitio$", "^local$", "^sede$", "^recinto$", "^donde$", "^dónde$"}},
      {"ita", {"^luogo$", "^posto$", "^locale$", "^sede$", "^sito$", "^dove$"}},
      {"nld", {"^locatie$", "^plaats$", "^plek$", "^zaal$", "^site$", "^waar$"}},
      {"por", {"^local$", "^lugar$", "^recinto$", "^sede$", "^sítio$", "^onde$"}},
  };

  source[FieldRole::TIMESTAMP] = {
      {"eng",
       {"^date$", "^timestamp$", "^datetime$", "^date.*time$", "^created.*at$",
        "^event.*date$", "^event.*time$", "^time$", "^when$"}},
      {"deu",
       {"^datum$", "^zeitstempel$", "^erstellt.*am$", "^veranstaltung.*datum$",
        "^veranstaltung.*zeit$", "^zeit$", "^wann$"}},
      {"fra",
       {"^date$", "^horodatage$", "^créé.*le$", "^événement.*date$",
        "^événement.*heure$", "^heure$", "^quand$"}},
      {"spa",
       {"^fecha$", "^timestamp$", "^creado.*el$", "^evento.*fecha$", "^evento.*hora$",
        "^hora$", "^cuándo$"}},
      {"ita",
       {"^data$", "^timestamp$", "^creato.*il$", "^evento.*data$", "^evento.*ora$",
        "^ora$", "^quando$"}},
      {"nld",
       {"^datum$", "^tijdstempel$", "^gemaakt.*op$", "^evenement.*datum$",
        "^evenement.*tijd$", "^tijd$", "^wanneer$"}},
      {"por",
       {"^data$", "^timestamp$", "^criado.*em$", "^evento.*data$", "^evento.*hora$",
        "^hora$", "^quando$"}},
  };

  source[FieldRole::LOCATION] = {
      {"eng",
       {"^address$", "^addr$", "^location$", "^place$", "^venue$", "^city$", "^town$",
        "^region$", "^area$", "^street$", "^full.*address$", "^event.*location$",
        "^event.*address$", "^event.*place$", "^postal.*address$"}},
      {"deu",
       {"^adresse$", "^ort$", "^standort$", "^platz$", "^veranstaltungsort$",
        "^stadt$", "^region$", "^straße$", "^strasse$", "^vollständige.*adresse$",
        "^veranstaltung.*ort$", "^veranstaltung.*adresse$", "^postadresse$"}},
      {"fra",
       {"^adresse$", "^lieu$", "^emplacement$", "^place$", "^salle$", "^ville$",
        "^région$", "^rue$", "^adresse.*complète$", "^événement.*lieu$",
        "^événement.*adresse$", "^adresse.*postale$"}},
      {"spa",
       {"^dirección$", "^lugar$", "^ubicación$", "^sitio$", "^local$", "^ciudad$",
        "^región$", "^calle$", "^dirección.*completa$", "^evento.*lugar$",
        "^evento.*dirección$", "^dirección.*postal$"}},
      {"ita",
       {"^indirizzo$", "^luogo$", "^posizione$", "^posto$", "^locale$", "^città$",
        "^regione$", "^via$", "^indirizzo.*completo$", "^evento.*luogo$",
        "^evento.*indirizzo$", "^indirizzo.*postale$"}},
      {"nld",
       {"^adres$", "^locatie$", "^plaats$", "^plek$", "^zaal$", "^stad$", "^regio$",
        "^straat$", "^volledig.*adres$", "^evenement.*locatie$", "^evenement.*adres$",
        "^postadres$"}},
      {"por",
       {"^endereço$", "^local$", "^localização$", "^lugar$", "^recinto$", "^cidade$",
        "^região$", "^rua$", "^endereço.*completo$", "^evento.*local$",
        "^evento.*endereço$", "^endereço.*postal$"}},
  };

  return source;
}

} // namespace

std::string fieldRoleToString(FieldRole role) {
  switch (role) {
  case FieldRole::TITLE:
    return "title";
  case FieldRole::DESCRIPTION:
    return "description";
  case FieldRole::LOCATION_NAME:
    return "locationName";
  case FieldRole::TIMESTAMP:
    return "timestamp";
  case FieldRole::LOCATION:
    return "location";
  }
  return "unknown";
}

FieldPatternTable::FieldPatternTable(const PatternSource &source) {
  for (const auto &[role, languages] : source) {
    for (const auto &[language, expressions] : languages) {
      if (expressions.empty()) {
        throw std::invalid_argument("Empty pattern list for " +
                                    fieldRoleToString(role) + "/" + language);
      }
      auto &compiled = table_[role][language];
      compiled.reserve(expressions.size());
      for (const auto &expression : expressions) {
        compiled.emplace_back(expression, std::regex::ECMAScript | std::regex::icase);
      }
    }
  }
}

const std::vector<std::regex> *
FieldPatternTable::patterns(FieldRole role, const std::string &language) const {
  auto roleIt = table_.find(role);
  if (roleIt == table_.end()) {
    return nullptr;
  }
  auto languageIt = roleIt->second.find(language);
  return languageIt == roleIt->second.end() ? nullptr : &languageIt->second;
}

int FieldPatternTable::matchIndex(const std::vector<std::regex> &patterns,
                                  const std::string &name) {
  const std::string folded = foldCase(name);
  for (size_t i = 0; i < patterns.size(); ++i) {
    if (std::regex_match(folded, patterns[i])) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

std::string FieldPatternTable::foldCase(const std::string &name) {
  std::string result;
  result.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(name[i]);
    // U+00C0..U+00DE except U+00D7 are upper-case Latin-1 letters, encoded
    // as 0xC3 0x80..0x9E; their lower-case forms are 0x20 higher.
    if (c == 0xC3 && i + 1 < name.size()) {
      const unsigned char next = static_cast<unsigned char>(name[i + 1]);
      result.push_back(name[i]);
      if (next >= 0x80 && next <= 0x9E && next != 0x97) {
        result.push_back(static_cast<char>(next + 0x20));
      } else {
        result.push_back(name[i + 1]);
      }
      ++i;
      continue;
    }
    result.push_back(static_cast<char>(std::tolower(c)));
  }
  return result;
}

const FieldPatternTable &FieldPatternTable::builtin() {
  static const FieldPatternTable table(builtinSource());
  return table;
}
