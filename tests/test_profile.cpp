/**
 * Visitor profile and field extraction.
 * Asserts:
 * - Fields are tri-state (Unset / Unknown / Value); a Value is never overwritten until reset.
 * - Completeness is true iff all five fields hold a Value.
 * - Extracted answers are cleaned (labels, quotes, "-1" sentinel, last three words).
 * - Contact candidates are matched against the directory or discarded.
 * - Intake questions follow the fixed field order.
 *
 * Run from build dir: ./test_profile
 */

#include "directory/contact_directory.h"
#include "graph/field_extractor.h"
#include "session/session_state.h"
#include "session/visitor_profile.h"
#include "fakes.h"
#include <iostream>
#include <map>
#include <string>

using namespace gate_sentry;
using gate_sentry::testing::FakeNlu;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static ContactDirectory make_directory() {
    std::map<std::string, std::string> contacts = {
        {"David Smith", "david.smith@example.com"},
        {"Alice Kimble", "alice.kimble@example.com"},
    };
    return ContactDirectory(contacts);
}

static std::vector<Message> transcript(const std::string& human_line) {
    return {Message::system("preamble"), Message::human(human_line)};
}

int main() {
    // --- FieldValue ---
    FieldValue unset;
    ASSERT(unset.is_unset());
    ASSERT(!unset.has_value());
    ASSERT(FieldValue::unknown().is_unknown());
    ASSERT(FieldValue::of("Alice").has_value());
    ASSERT(FieldValue::of("Alice").value() == "Alice");
    ASSERT(FieldValue::of("Alice") != FieldValue::of("Bob"));

    // --- set_if_absent / mark_unknown ---
    VisitorProfile profile;
    ASSERT(profile.set_if_absent(ProfileField::Name, "Alice"));
    ASSERT(!profile.set_if_absent(ProfileField::Name, "Bob"));
    ASSERT(profile.name.value() == "Alice");
    profile.mark_unknown(ProfileField::Name);
    ASSERT(profile.name.has_value());
    ASSERT(!profile.set_if_absent(ProfileField::Purpose, ""));
    ASSERT(profile.purpose.is_unset());
    profile.mark_unknown(ProfileField::Purpose);
    ASSERT(profile.purpose.is_unknown());
    ASSERT(profile.set_if_absent(ProfileField::Purpose, "meeting"));

    // --- completeness ---
    ASSERT(!profile.is_complete());
    ProfileField missing = ProfileField::Name;
    ASSERT(profile.first_missing(missing));
    ASSERT(missing == ProfileField::ContactPerson);
    profile.set_if_absent(ProfileField::ContactPerson, "David Smith");
    profile.set_if_absent(ProfileField::ThreatLevel, "none");
    ASSERT(!profile.is_complete());
    profile.set_if_absent(ProfileField::Affiliation, "Acme");
    ASSERT(profile.is_complete());
    ASSERT(!profile.first_missing(missing));
    ASSERT(check_completeness(profile));
    ASSERT(profile.id_verified);
    profile.reset();
    ASSERT(profile.name.is_unset());
    ASSERT(!profile.id_verified);

    // Unknown does not count toward completeness
    VisitorProfile almost;
    almost.set_if_absent(ProfileField::Name, "Alice");
    almost.set_if_absent(ProfileField::Purpose, "delivery");
    almost.set_if_absent(ProfileField::ContactPerson, "David Smith");
    almost.set_if_absent(ProfileField::ThreatLevel, "none");
    almost.mark_unknown(ProfileField::Affiliation);
    ASSERT(!almost.is_complete());

    // --- clean_extracted_value ---
    ASSERT(clean_extracted_value(ProfileField::Name, "-1") == std::nullopt);
    ASSERT(clean_extracted_value(ProfileField::Name, "  ") == std::nullopt);
    ASSERT(clean_extracted_value(ProfileField::Name, "\"-1\"") == std::nullopt);
    ASSERT(clean_extracted_value(ProfileField::Name, "Alice Walker").value() == "Alice Walker");
    ASSERT(clean_extracted_value(ProfileField::Name, "Name: Alice Walker.").value() == "Alice Walker");
    ASSERT(clean_extracted_value(ProfileField::Name, "\"Alice\"").value() == "Alice");
    ASSERT(clean_extracted_value(ProfileField::Name, "<think>hmm</think>Alice").value() == "Alice");
    ASSERT(clean_extracted_value(ProfileField::Name, "Alice\nThe visitor said so").value() == "Alice");
    ASSERT(clean_extracted_value(ProfileField::Purpose, "I am here for the quarterly review").value() ==
           "the quarterly review");
    ASSERT(clean_extracted_value(ProfileField::Purpose, "The purpose is delivery").value() == "delivery");
    // Contact names are matched later and kept whole
    ASSERT(clean_extracted_value(ProfileField::ContactPerson, "Mr David Smith Junior").value() ==
           "Mr David Smith Junior");

    // --- contact directory ---
    ContactDirectory directory = make_directory();
    ASSERT(directory.size() == 2);
    ASSERT(directory.match("David Smith").value() == "David Smith");
    ASSERT(directory.match("  david smith ").value() == "David Smith");
    ASSERT(!directory.match("Dave").has_value());
    ASSERT(directory.email_for("alice kimble").value() == "alice.kimble@example.com");

    VisitorProfile contact_profile;
    ASSERT(validate_contact(contact_profile, directory, std::string("alice kimble")));
    ASSERT(contact_profile.contact_person.value() == "Alice Kimble");

    VisitorProfile mismatch;
    ASSERT(!validate_contact(mismatch, directory, std::string("Nobody Known")));
    ASSERT(mismatch.contact_person.is_unknown());
    ASSERT(!validate_contact(mismatch, directory, std::nullopt));

    // --- intake questions ---
    VisitorProfile empty;
    ASSERT(intake_question(empty, directory, "fallback") == "What is your name?");
    empty.set_if_absent(ProfileField::Name, "Alice");
    ASSERT(intake_question(empty, directory, "fallback") == "What is the purpose of your visit today?");
    empty.set_if_absent(ProfileField::Purpose, "meeting");
    std::string contact_question = intake_question(empty, directory, "fallback");
    ASSERT(contact_question.find("Who is your contact?") == 0);
    ASSERT(contact_question.find("David Smith") != std::string::npos);
    ASSERT(contact_question.find("Alice Kimble") != std::string::npos);
    empty.set_if_absent(ProfileField::ContactPerson, "David Smith");
    empty.set_if_absent(ProfileField::ThreatLevel, "none");
    ASSERT(intake_question(empty, directory, "fallback") == "What company or organization are you with?");
    empty.set_if_absent(ProfileField::Affiliation, "Acme");
    ASSERT(intake_question(empty, directory, "fallback") == "fallback");

    // --- FieldExtractor ---
    FakeNlu nlu;
    FieldExtractor extractor(nlu);
    nlu.answers[ProfileField::Name] = "Alice Walker";
    nlu.answers[ProfileField::ContactPerson] = "david smith";

    VisitorProfile extracted;
    ExtractionOutcome outcome = extractor.extract(extracted, transcript("I'm Alice Walker, here to see david smith"));
    ASSERT(extracted.name.value() == "Alice Walker");
    ASSERT(extracted.purpose.is_unknown());
    ASSERT(extracted.contact_person.is_unset());
    ASSERT(outcome.contact_candidate.value() == "david smith");
    ASSERT(outcome.failed.size() == 3);

    // A stored value is never re-extracted or overwritten
    nlu.answers[ProfileField::Name] = "Bob Jones";
    nlu.answers[ProfileField::Purpose] = "delivery";
    extractor.extract(extracted, transcript("Actually I'm Bob, delivering a parcel"));
    ASSERT(extracted.name.value() == "Alice Walker");
    ASSERT(nlu.extract_calls[ProfileField::Name] == 1);
    ASSERT(extracted.purpose.value() == "delivery");

    // Call failures leave fields Unknown, never Value
    FakeNlu broken;
    broken.fail_extraction = true;
    FieldExtractor broken_extractor(broken);
    VisitorProfile untouched;
    ExtractionOutcome none = broken_extractor.extract(untouched, transcript("hello"));
    ASSERT(none.extracted.empty());
    ASSERT(untouched.name.is_unknown());
    ASSERT(!none.contact_candidate.has_value());

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All profile tests passed.\n";
    return 0;
}
