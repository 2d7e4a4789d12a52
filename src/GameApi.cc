#include "GameApi.hh"

void GameApiRegistry::add(const string &game, shared_ptr<GameApi> api)
{
    apis[game] = std::move(api);
}

GameApi *GameApiRegistry::find(const string &game) const
{
    auto it = apis.find(game);
    return it == apis.end() ? nullptr : it->second.get();
}
