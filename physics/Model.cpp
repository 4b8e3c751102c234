#include "Model.hpp"

#include "Boids.hpp"

#include "Logging.hpp"

std::unique_ptr<Physics::Model> Physics::CreateModel(Physics::ModelType type, Physics::ModelParams params)
{
  switch ((int)type)
  {
  case Physics::ModelType::BOIDS:
    return std::make_unique<Physics::Boids>(params);
  default:
    return nullptr;
  }
  return nullptr;
}

bool Physics::Model::updateInputJson(const json& newJson)
{
  json mergedJson = m_inputJson;
  mergedJson.merge_patch(newJson);

  // No modification
  if (json::diff(m_inputJson, mergedJson).empty())
    return true;

  json previousJson = m_inputJson;
  m_inputJson = mergedJson;

  if (!updateModelWithInputJson())
  {
    LOG_ERROR("Input json rejected, previous parameters restored");
    m_inputJson = previousJson;
    return false;
  }

  return true;
}
