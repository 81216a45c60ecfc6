#include <citegraph/models.h>

#include <cctype>

namespace citegraph {

std::string RelationshipName(RelationshipKind kind) {
  switch (kind) {
  case RelationshipKind::kDefines:
    return "defines";
  case RelationshipKind::kCrossReference:
    return "cross_reference";
  case RelationshipKind::kCites:
    return "cites";
  case RelationshipKind::kAmends:
    return "amends";
  case RelationshipKind::kSupersedes:
    return "supersedes";
  case RelationshipKind::kUnknown:
    return "unknown";
  }
  return "unknown";
}

std::string DocumentClassName(DocumentClass value) {
  switch (value) {
  case DocumentClass::kCriminalStatute:
    return "criminal_statute";
  case DocumentClass::kCivilStatute:
    return "civil_statute";
  case DocumentClass::kDefinitional:
    return "definitional";
  case DocumentClass::kProcedural:
    return "procedural";
  case DocumentClass::kOther:
    return "other";
  }
  return "other";
}

std::string SearchableText(const Document &document) {
  std::string text;
  for (std::size_t i = 0; i < document.body.size(); ++i) {
    if (i > 0) {
      text.push_back('\n');
    }
    text.append(document.body[i]);
  }
  return text;
}

std::size_t CountWords(const std::vector<std::string> &paragraphs) {
  std::size_t count = 0;
  for (const auto &paragraph : paragraphs) {
    bool in_word = false;
    for (const auto character : paragraph) {
      const bool is_space =
          std::isspace(static_cast<unsigned char>(character)) != 0;
      if (!is_space && !in_word) {
        ++count;
      }
      in_word = !is_space;
    }
  }
  return count;
}

} // namespace citegraph
