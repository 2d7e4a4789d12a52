#pragma once

#include <string>

#include "Account.hh"

using namespace std;

enum class TaskState
{
    Pending,
    Running,
    Done
};

/*
One unit of work: a single task kind against a single game for a single account.
Created by the orchestrator when expanding accounts, discarded once a TaskResult exists for it.
*/
struct GameTask
{
    // "<account>/<game>/<kind>", unique within a run
    string id;
    // Owning account; outlives the task
    const Account *account = nullptr;
    string game;
    TaskKind kind = TaskKind::SignIn;
    // Number of API calls made so far (verification retry included)
    int attempts = 0;
    TaskState state = TaskState::Pending;

    GameTask() = default;

    GameTask(const Account &owner, const string &gameId, TaskKind taskKind)
        : id(owner.id + "/" + gameId + "/" + taskKindToString(taskKind)),
          account(&owner),
          game(gameId),
          kind(taskKind)
    {
    }
};
