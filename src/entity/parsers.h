#ifndef ESTUARY_SRC_ENTITY_PARSERS_H_
#define ESTUARY_SRC_ENTITY_PARSERS_H_

#include <string>

#include "entities.h"
#include "record/record.h"

namespace Estuary {

/*
 * Record -> entity extraction. Every parser is total: a missing or malformed
 * tag resolves to the documented default and never fails the caller.
 */

// d -> slug, title (default: slug), content -> description, repo, picture,
// hashtags (all values of the first group), agent*, mcp*
Project ParseProject(const Record& record);

// a -> project, title (optional), p* -> mentioned agents
Conversation ParseConversation(const Record& record);

/**
 * Kind 513 record refreshing a conversation: e -> conversation id, title,
 * reply-count. The result only carries the identity; the merge policy reads
 * the supplied fields from its source.
 */
Conversation ParseConversationMetadata(const Record& record);

// a -> project, title (default "Untitled Task"), status, p* -> assignees,
// branch, e -> related conversation
Task ParseTask(const Record& record);

// Reply rooted at a task, used to refresh status/assignees/branch/title.
Task ParseTaskUpdate(const Record& record);

/**
 * Profile id is the record id, or the value of the `e` tag when the record
 * supersedes an earlier profile. Identity in the store is "creator:id".
 */
AgentProfile ParseAgentProfile(const Record& record);
std::string AgentProfileIdentity(const Record& record);

// a -> project, agent* = [agent, pubkey, slug]; groups shorter than 3 are skipped
ProjectStatus ParseProjectStatus(const Record& record);

// e -> conversation, a -> project, phase; kind 24112 yields a stopped signal
TypingSignal ParseTypingSignal(const Record& record);

// e -> task
TaskAbortSignal ParseTaskAbort(const Record& record);

// Content JSON {title, content}; raw content and the `title` tag otherwise
Lesson ParseLesson(const Record& record);

// E (else e) -> root, K -> root kind, a -> project, p*, status, phase
Reply ParseReply(const Record& record);

// a -> project, content JSON {model, temperature, maxTokens, provider}
LlmConfigChange ParseLlmConfigChange(const Record& record);

}  // namespace Estuary

#endif  // ESTUARY_SRC_ENTITY_PARSERS_H_
