#pragma once

namespace synapse
{
namespace common
{

class Logger;
class SubsystemLogger;

} // common
} // synapse
