#ifndef ESTUARY_SRC_STORE_MERGE_POLICIES_H_
#define ESTUARY_SRC_STORE_MERGE_POLICIES_H_

#include "entity/entities.h"

namespace Estuary {

/*
 * Field-update policies applied by MergeStore when a newer record arrives for
 * a known identity. Merge(stored, candidate) returns the new version.
 *
 * Non-destructive entities (Project, Conversation, Task, AgentProfile) take a
 * field from the candidate's source record only when that record supplies a
 * non-empty value; absent fields keep what was known. Presence entities
 * (ProjectStatus, TypingSignal, LlmConfigChange) are snapshots and are
 * replaced wholesale. Append-only entities never change after creation.
 */

Project Merge(const Project& stored, const Project& candidate);
Conversation Merge(const Conversation& stored, const Conversation& candidate);
Task Merge(const Task& stored, const Task& candidate);
AgentProfile Merge(const AgentProfile& stored, const AgentProfile& candidate);

ProjectStatus Merge(const ProjectStatus& stored, const ProjectStatus& candidate);
TypingSignal Merge(const TypingSignal& stored, const TypingSignal& candidate);
LlmConfigChange Merge(const LlmConfigChange& stored, const LlmConfigChange& candidate);

Lesson Merge(const Lesson& stored, const Lesson& candidate);
Reply Merge(const Reply& stored, const Reply& candidate);
TaskAbortSignal Merge(const TaskAbortSignal& stored, const TaskAbortSignal& candidate);

}  // namespace Estuary

#endif  // ESTUARY_SRC_STORE_MERGE_POLICIES_H_
