#pragma once

/** \file exclude_notation.hpp
 *  \brief Text notation for exclusion specs.
 *
 * Grammar (whitespace between tokens is ignored):
 *
 *   spec     := "everything" | "nothing" | "any(" list? ")" | "all(" list? ")" | rule
 *   list     := spec ("," spec)*
 *   rule     := field (":" field (":" artifact)?)?
 *   field    := "*" | word
 *   artifact := "*" | word ("@" part ("@" part ("@" part)?)?)?
 *   part     := "*" | word
 *   word     := [A-Za-z0-9_.+$-]+
 *
 * "*" means any value. A single field is a group rule ("org.foo" == "org.foo:*").
 * An artifact is name[@type[@extension[@classifier]]]; the type defaults to "jar".
 *
 * This is the same notation to_string(exclude_spec) produces. Composites are
 * built through the supplied factory, so a normalizing factory simplifies what
 * it parses.
 */

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "prune/error.hpp"
#include "prune/exclude_factory.hpp"

namespace prune {

/** \brief Parse one spec.
 *
 * \return the spec, or invalid_argument (component "notation.parse") naming
 *         the byte offset of the first unexpected character
 */
auto parse_exclude(std::string_view text, const ExcludeFactory& factory)
    -> std::expected<exclude_spec, core::error>;

/** \brief Parse one spec per line, skipping blank lines and '#' comments.
 *
 * Errors carry the 1-based line number in the message.
 */
auto parse_exclude_lines(const std::vector<std::string>& lines, const ExcludeFactory& factory)
    -> std::expected<std::vector<exclude_spec>, core::error>;

} // namespace prune
