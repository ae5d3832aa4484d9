#pragma once

#include "triage/severity.hpp"
#include "triage/treatment.hpp"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

// Shown instead of a treatment response when the safety override fires.
inline const std::string CRISIS_RESOURCES =
    "## You're Not Alone\n"
    "\n"
    "If you're having thoughts of self-harm, please reach out now:\n"
    "\n"
    "SOS 24-hour Hotline: 1-767\n"
    "IMH Mental Health Helpline: 6389-2222\n"
    "Samaritans of Singapore: 1800-221-4444\n"
    "\n"
    "These services are free, confidential, and available 24/7.\n"
    "\n"
    "**You matter. Help is available.**\n";

// ---------------------------------------------------------------------------
// ResponseCatalog — (treatment × severity) → response template
//
// Every cell must be populated and longer than MIN_TEMPLATE_LENGTH. The
// check runs in the constructor so a bad catalog fails at startup rather
// than on a live request.
// ---------------------------------------------------------------------------
class ResponseCatalog {
public:
    static constexpr size_t MIN_TEMPLATE_LENGTH = 50;

    using Row = std::array<std::string, 3>;  // indexed by severity

    ResponseCatalog() : ResponseCatalog(default_templates(Treatment::A),
                                        default_templates(Treatment::B)) {}

    ResponseCatalog(Row treatment_a, Row treatment_b)
        : a_(std::move(treatment_a)), b_(std::move(treatment_b)) {
        for (Treatment t : treatment::ALL) {
            for (Severity s : severity::ALL) {
                const auto& text = cell(t, s);
                if (text.size() <= MIN_TEMPLATE_LENGTH) {
                    throw std::invalid_argument(
                        "Response template for " + treatment::to_string(t) + "/" +
                        severity::to_string(s) + " must exceed " +
                        std::to_string(MIN_TEMPLATE_LENGTH) + " characters (got " +
                        std::to_string(text.size()) + ")");
                }
            }
        }
    }

    const std::string& select(Treatment t, Severity s) const { return cell(t, s); }

    static Row default_templates(Treatment t) {
        switch (t) {
            case Treatment::A:
                return {
                    "**Assessment Complete**\n\n"
                    "Symptom severity: **Mild**\n\n"
                    "Your responses indicate low distress levels. "
                    "Preventive self-care is recommended. "
                    "Professional consultation available if desired.",

                    "**Assessment Complete**\n\n"
                    "Symptom severity: **Moderate**\n\n"
                    "Your responses indicate moderate distress. "
                    "Recommended action: Consultation with a mental health professional. "
                    "Early intervention can prevent escalation.",

                    "**Assessment Complete**\n\n"
                    "Symptom severity: **High**\n\n"
                    "Your responses indicate significant distress. "
                    "Immediate professional support is strongly recommended. "
                    "A counselor can help you navigate these feelings.",
                };
            case Treatment::B:
                return {
                    "Thank you for sharing with me.\n\n"
                    "It sounds like you're managing, and that takes strength. "
                    "Even when things feel okay, having someone to talk to can help "
                    "maintain your wellbeing. Would you like to explore some self-care "
                    "resources, or connect with a supportive listener?",

                    "I hear you, and I want you to know that what you're feeling matters.\n\n"
                    "It sounds like you're carrying quite a bit right now. "
                    "You don't have to figure this out alone. "
                    "Speaking with someone who understands can make a real difference. "
                    "Would you be open to connecting with a counselor who can help?",

                    "I'm really glad you reached out. What you're going through sounds "
                    "incredibly hard.\n\n"
                    "Please know that these feelings, as overwhelming as they are, can get "
                    "better with support. You've taken an important step by sharing this. "
                    "I'd really encourage you to speak with someone who can help you "
                    "through this. Would you like to connect with a counselor now?",
                };
        }
        throw std::invalid_argument("Unknown treatment");
    }

private:
    Row a_;
    Row b_;

    static size_t index(Severity s) {
        switch (s) {
            case Severity::MILD:     return 0;
            case Severity::MODERATE: return 1;
            case Severity::SEVERE:   return 2;
        }
        return 0;
    }

    const std::string& cell(Treatment t, Severity s) const {
        switch (t) {
            case Treatment::A: return a_[index(s)];
            case Treatment::B: return b_[index(s)];
        }
        return a_[index(s)];
    }
};
