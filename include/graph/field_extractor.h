#pragma once

/**
 * @file field_extractor.h
 * @brief Profile extraction, contact validation and intake questions
 */

#include "core/types.h"
#include "directory/contact_directory.h"
#include "session/visitor_profile.h"
#include <optional>
#include <string>
#include <vector>

namespace gate_sentry {

class NluService;

/**
 * @brief Clean a raw extraction answer
 *
 * Strips reasoning blocks, leading labels ("Name:", "Answer:", "The name is"),
 * surrounding quotes and trailing punctuation. Non-contact fields are cut to
 * their last three words.
 * @return Cleaned value, or nullopt for the "-1" sentinel / empty answers
 */
std::optional<std::string> clean_extracted_value(ProfileField field, const std::string& raw);

/**
 * @brief Result of one extraction pass
 */
struct ExtractionOutcome {
    std::vector<ProfileField> extracted;          ///< Fields that gained a value
    std::vector<ProfileField> failed;             ///< Fields queried without a usable answer
    std::optional<std::string> contact_candidate; ///< Unvalidated contact name, if any
};

/**
 * @brief Query every field that does not yet hold a value
 *
 * Fields holding a value are never queried. contact_person is not written
 * here: its answer is returned as contact_candidate for validate_contact().
 */
class FieldExtractor {
public:
    explicit FieldExtractor(NluService& nlu) : nlu_(nlu) {}

    ExtractionOutcome extract(VisitorProfile& profile, const std::vector<Message>& messages);

private:
    NluService& nlu_;
};

/**
 * @brief Commit a contact candidate if the directory knows it
 *
 * Match is exact, then case-insensitive; the directory spelling is stored.
 * A miss leaves the field Unknown.
 * @return true if the candidate matched
 */
bool validate_contact(VisitorProfile& profile, const ContactDirectory& directory,
                      const std::optional<std::string>& candidate);

/**
 * @brief Completeness check; sets id_verified to the result
 */
bool check_completeness(VisitorProfile& profile);

/**
 * @brief Question for the first missing field, in priority order
 * @param fallback Used when nothing is missing
 */
std::string intake_question(const VisitorProfile& profile, const ContactDirectory& directory,
                            const std::string& fallback);

} // namespace gate_sentry
