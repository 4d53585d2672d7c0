#pragma once

namespace synapse
{

enum LogLevel : int;

} // synapse
