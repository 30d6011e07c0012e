#include "src/memory_session_store.hpp"
#include "src/interview_errors.hpp"
#include <iostream>
#include <string>
#include <vector>

int main() {
    std::cout << "=== Testing Session Store ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    MemorySessionStore store;
    const TimePoint t0 = fromEpochMillis(1700000000000);

    std::cout << "\n--- Sessions ---" << std::endl;
    Session draft;
    draft.candidate_id = 7;
    draft.result_id = 10;
    draft.started_at = t0;
    Session first = store.createSession(draft);
    Session second = store.createSession(draft);
    check("Ids are assigned", first.id > 0 && second.id > first.id);
    check("Latest active session wins", store.findActiveSession(7, 10)->id == second.id);

    second.status = SessionStatus::COMPLETED;
    store.updateSession(second);
    check("Completed sessions are not active", store.findActiveSession(7, 10)->id == first.id);
    check("No active session for another result", !store.findActiveSession(7, 11));

    Session ghost;
    ghost.id = 999;
    bool rejected = false;
    try {
        store.updateSession(ghost);
    } catch (const StoreError&) {
        rejected = true;
    }
    check("Updating a missing session fails", rejected);

    std::cout << "\n--- Questions and events ---" << std::endl;
    Question question;
    question.session_id = first.id;
    question.text = "Describe your caching layer.";
    question.created_at = t0;
    Question stored = store.createQuestion(question);
    Question other = store.createQuestion(question);
    check("Questions listed in creation order", store.listQuestions(first.id).size() == 2 &&
          store.listQuestions(first.id)[0].id == stored.id);
    check("Unanswered question", !store.getQuestion(stored.id)->isAnswered());

    stored.time_taken_seconds = 40;
    stored.answer_text = "Write-through with Redis.";
    store.updateQuestion(stored);
    check("Answered question", store.getQuestion(stored.id)->isAnswered());
    check("Other question untouched", !store.getQuestion(other.id)->isAnswered());

    ProctorEvent event;
    event.session_id = first.id;
    event.created_at = t0;
    event.event_type = ProctorEventType::NO_FACE;
    event.meta = {{"faces_count", 0}};
    ProctorEvent saved = store.createEvent(event);
    check("Event id assigned", saved.id > 0);
    check("Events listed per session", store.listEvents(first.id).size() == 1 && store.listEvents(second.id).empty());

    std::cout << "\n--- Contexts ---" << std::endl;
    json payload = json::parse(R"({
        "result_id": 10,
        "candidate_id": 7,
        "shortlisted": true,
        "job_title": "Backend Engineer",
        "questions": ["  What is RAII? ", "", {"question": "Explain move semantics", "difficulty": "hard"}, 42]
    })");
    InterviewContext context = InterviewContext::fromJson(payload);
    check("Blank and invalid pool entries dropped", context.questions.size() == 2);
    check("Pool text trimmed", context.questions.size() == 2 && context.questions[0].text == "What is RAII?");
    check("Pool object entries keep difficulty", context.questions.size() == 2 &&
          context.questions[1].difficulty == "hard" && context.questions[1].topic == "general");
    check("Wrapped pool accepted", InterviewContext::normalizeQuestions(
          json::parse(R"({"questions": ["One", "Two"]})")).size() == 2);

    store.saveContext(context);
    check("Context stored by result id", store.getContext(10) && store.getContext(10)->job_title == "Backend Engineer");
    check("Contexts listed per candidate", store.listContextsForCandidate(7).size() == 1 &&
          store.listContextsForCandidate(8).empty());

    std::cout << "\n--- Records as JSON ---" << std::endl;
    first.baseline_face_signature = encodeSignature({0.5f, 0.25f});
    Session restored = Session::fromJson(first.toJson());
    check("Session survives JSON", restored.id == first.id && restored.started_at == first.started_at &&
          restored.baseline_face_signature == first.baseline_face_signature);
    auto signature = decodeSignature(*restored.baseline_face_signature);
    check("Signature decodes", signature && signature->size() == 2 && (*signature)[1] == 0.25f);
    check("Non-array signature is rejected", !decodeSignature("{\"a\": 1}"));
    check("Unparseable signature is rejected", !decodeSignature("not json"));

    ProctorEvent event_back = ProctorEvent::fromJson(saved.toJson());
    check("Event type survives JSON", event_back.event_type == ProctorEventType::NO_FACE);
    check("Event type names", eventTypeToString(ProctorEventType::FACE_MISMATCH) == "face_mismatch" &&
          stringToEventType("baseline_multi_face") == ProctorEventType::BASELINE_MULTI_FACE);

    if (failures == 0) {
        std::cout << "\n✅ All session store tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " session store test(s) failed" << std::endl;
    return 1;
}
