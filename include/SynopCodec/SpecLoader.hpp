#pragma once
// SpecLoader.hpp – Parses the FM-12 XML code book into a CodeBook.

#include "Types.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace synop {

// Thrown when the XML is structurally invalid or violates the schema rules.
class SpecLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads the code tables and group layouts from the given XML file path.
// Throws SpecLoadError on any parse or validation failure.
CodeBook loadSpec(const std::filesystem::path& xml_path);

} // namespace synop
